#include "output/file_sink.hpp"

#include <polyexec/logging.hpp>

#include <cstdio>
#include <string_view>

namespace polyexec {

void FileSink::write(std::string_view str) {
    if (std::fwrite(str.data(), 1, str.size(), file_) != str.size()) {
        LOG_DEBUG("Short write to output stream: {}", get_err_msg());
    }
}

void FileSink::flush() {
    if (std::fflush(file_) != 0) {
        LOG_DEBUG("Flushing output stream failed: {}", get_err_msg());
    }
}

} // namespace polyexec
