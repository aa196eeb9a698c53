#pragma once

#include "output/sink.hpp"

#include <cstdio>
#include <string_view>

namespace polyexec {

/// Writes to a C stream it does not own (stdout, stderr)
class FileSink : public Sink
{
public:
    explicit FileSink(std::FILE* file)
        : file_{file} {}

    void write(std::string_view str) override;
    void flush() override;

    ~FileSink() override = default;

private:
    std::FILE* file_;
};

} // namespace polyexec
