#include <polyexec/logging.hpp>

#include "app/exec_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <exception>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace polyexec;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        ProgramOptions options = parse_args_or_exit(args);

        ExecApp app{std::move(options)};

        return app.run();
    } catch (const std::exception& ex) {
        trace_exception(fmt::format("caught in main: {}", ex.what()));
    } catch (...) {
        trace_exception("caught in main: <unknown - not derived from std::exception>");
    }

    return App::INTERNAL_ERROR_EXIT_CODE;
}
