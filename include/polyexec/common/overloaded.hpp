#pragma once

namespace polyexec {

// https://en.cppreference.com/w/cpp/utility/variant/visit2.html
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace polyexec
