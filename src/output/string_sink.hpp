#pragma once

#include "output/sink.hpp"

#include <string>
#include <string_view>

namespace polyexec {

/// Collects everything written into a string
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }

    void flush() override {}

    const std::string& get_buffer() const { return buffer_; }

    ~StringSink() override = default;

private:
    std::string buffer_;
};

} // namespace polyexec
