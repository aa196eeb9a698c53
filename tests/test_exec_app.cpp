#include "catch2_custom.hpp"

#include <polyexec/common/error_types.hpp>
#include <polyexec/execution/result.hpp>

#include "app/exec_app.hpp"
#include "output/string_sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include "fake_runtime.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using polyexec::ExecApp;
using polyexec::ExecutionError;
using polyexec::Expected;
using polyexec::Outcome;
using polyexec::ProgramOptions;
using polyexec::StringSink;
using polyexec::VerbosityLevel;
using polyexec::test::exited;
using polyexec::test::FakeRuntime;
using polyexec::test::timed_out;

using Argv = std::vector<std::string>;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Runs one ExecApp against a FakeRuntime, keeping what it wrote
struct AppHarness
{
    std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
    StringSink out;
    StringSink err;
    fs::path source_path = fs::temp_directory_path() / ("polyexec-app-test-" + std::to_string(::getpid()) + ".c");

    AppHarness() = default;
    AppHarness(const AppHarness&) = delete;
    AppHarness& operator=(const AppHarness&) = delete;

    ~AppHarness() { fs::remove(source_path); }

    static ProgramOptions make_options(VerbosityLevel verbosity) {
        ProgramOptions opts;
        opts.verbosity = verbosity;
        opts.colorize_option = ProgramOptions::ColorizeOpt::Never;
        return opts;
    }

    int execute(const std::string& language, const std::string& source, VerbosityLevel verbosity) {
        std::ofstream{source_path, std::ios::binary} << source;

        ProgramOptions opts = make_options(verbosity);
        opts.language_name = language;
        opts.file_name = source_path.string();

        return ExecApp{std::move(opts), runtime, out, err}.run();
    }

    int run(ProgramOptions opts) { return ExecApp{std::move(opts), runtime, out, err}.run(); }
};

Expected<polyexec::CommandOutcome, ExecutionError> hello_world(const Argv& argv,
                                                                std::chrono::steady_clock::time_point /*deadline*/) {
    if (argv.front() == "gcc") {
        return exited(0, "", "warning: unused parameter\n");
    }
    return exited(0, "Hello, World!\n");
}

} // namespace

TEST_CASE("Exit codes follow the outcome") {
    REQUIRE(polyexec::to_exit_code(Outcome::Success) == 0);
    REQUIRE(polyexec::to_exit_code(Outcome::CompileError) == 1);
    REQUIRE(polyexec::to_exit_code(Outcome::RuntimeError) == 1);
    REQUIRE(polyexec::to_exit_code(Outcome::Timeout) == 1);
    REQUIRE(polyexec::to_exit_code(Outcome::InfrastructureError) == 2);
}

TEST_CASE("Running a source file") {
    AppHarness app;
    app.runtime->on_exec = hello_world;

    SECTION("Normal output shows the outcome and both streams") {
        REQUIRE(app.execute("c", "int main(void) { return 0; }", VerbosityLevel::Normal) == 0);

        const std::string& out = app.out.get_buffer();
        REQUIRE(contains(out, "Outcome:        SUCCESS\n"));
        REQUIRE(contains(out, "Exit code:      0\n"));
        REQUIRE(contains(out, "--- stdout ---"));
        REQUIRE(contains(out, "Hello, World!\n"));
        REQUIRE(contains(out, "--- stderr ---"));
        REQUIRE_FALSE(contains(out, "warning: unused parameter"));
        REQUIRE_FALSE(contains(out, "Language:"));
        REQUIRE(app.err.get_buffer().empty());
    }

    SECTION("Verbose output describes the request") {
        REQUIRE(app.execute("C", "int main(void) { return 0; }", VerbosityLevel::Verbose) == 0);

        REQUIRE(contains(app.out.get_buffer(), "Language: c (via isolated-container)\n"));
        REQUIRE(contains(app.out.get_buffer(), "Source:   28 bytes\n"));
        REQUIRE(contains(app.out.get_buffer(), "Timeout:  language default\n"));
    }

    SECTION("Quiet output is the program's own output only") {
        REQUIRE(app.execute("c", "int main(void) { return 0; }", VerbosityLevel::Quiet) == 0);

        REQUIRE(app.out.get_buffer() == "Hello, World!\n");
        REQUIRE(app.err.get_buffer().empty());
    }

    SECTION("Silent output is nothing at all") {
        REQUIRE(app.execute("c", "int main(void) { return 0; }", VerbosityLevel::Silent) == 0);

        REQUIRE(app.out.get_buffer().empty());
        REQUIRE(app.err.get_buffer().empty());
    }

    REQUIRE(app.runtime->live_units() == 0);
}

TEST_CASE("Program failures exit with 1") {
    AppHarness app;

    SECTION("Compile errors") {
        app.runtime->on_exec = [](const Argv& /*argv*/, auto /*deadline*/) -> Expected<polyexec::CommandOutcome,
                                                                                       ExecutionError> {
            return exited(1, "", "source.c:1:13: error: expected ';' before '}' token\n");
        };

        REQUIRE(app.execute("c", "int main() { return 0 }", VerbosityLevel::Quiet) == 1);

        REQUIRE(app.out.get_buffer().empty());
        REQUIRE(app.err.get_buffer() == "source.c:1:13: error: expected ';' before '}' token\n");
    }

    SECTION("Runtime errors") {
        app.runtime->on_exec = [](const Argv& argv, auto /*deadline*/) -> Expected<polyexec::CommandOutcome,
                                                                                   ExecutionError> {
            if (argv.front() == "gcc") {
                return exited(0);
            }
            return exited(134, "partial\n", "Aborted\n");
        };

        REQUIRE(app.execute("c", "int main(void) { abort(); }", VerbosityLevel::Normal) == 1);

        REQUIRE(contains(app.out.get_buffer(), "Outcome:        RUNTIME_ERROR\n"));
        REQUIRE(contains(app.out.get_buffer(), "Exit code:      134\n"));
        REQUIRE(contains(app.out.get_buffer(), "partial\n"));
        REQUIRE(contains(app.out.get_buffer(), "Aborted\n"));
    }

    SECTION("Timeouts") {
        app.runtime->on_exec = [](const Argv& argv, auto /*deadline*/) -> Expected<polyexec::CommandOutcome,
                                                                                   ExecutionError> {
            if (argv.front() == "gcc") {
                return exited(0);
            }
            return timed_out("loop\n");
        };

        REQUIRE(app.execute("c", "int main(void) { for (;;); }", VerbosityLevel::Normal) == 1);

        REQUIRE(contains(app.out.get_buffer(), "Outcome:        TIMEOUT\n"));
        REQUIRE(contains(app.out.get_buffer(), "Exit code:      (none)\n"));
        REQUIRE(app.runtime->terminate_calls() == 1);
    }
}

TEST_CASE("Truncated output is flagged") {
    AppHarness app;
    app.runtime->on_exec = [](const Argv& /*argv*/, auto /*deadline*/) -> Expected<polyexec::CommandOutcome,
                                                                                   ExecutionError> {
        auto outcome = exited(0, "yyyy");
        outcome.stdout_capture.truncated = true;
        return outcome;
    };

    REQUIRE(app.execute("c", "int main(void) { for (;;) puts(\"y\"); }", VerbosityLevel::Normal) == 0);

    REQUIRE(app.err.get_buffer() == "Output was truncated at the capture limit\n");
}

TEST_CASE("Requests that cannot be served exit with 2") {
    AppHarness app;

    SECTION("Unknown languages") {
        REQUIRE(app.execute("cobol", "DISPLAY 'HI'.", VerbosityLevel::Normal) == 2);

        REQUIRE(app.out.get_buffer().empty());
        REQUIRE(app.err.get_buffer() == "Unsupported language \"cobol\". See --list-languages.\n");
        REQUIRE(app.runtime->mounts_seen().empty());
    }

    SECTION("Unreadable sources") {
        ProgramOptions opts = AppHarness::make_options(VerbosityLevel::Normal);
        opts.language_name = "c";
        opts.file_name = "/nonexistent/polyexec/source.c";

        REQUIRE(app.run(std::move(opts)) == 2);
        REQUIRE(contains(app.err.get_buffer(), "Could not open source file"));
    }

    SECTION("Infrastructure errors") {
        app.runtime->reachable = false;

        REQUIRE(app.execute("rust", "fn main() {}", VerbosityLevel::Normal) == 2);

        REQUIRE(contains(app.out.get_buffer(), "Outcome:        INFRASTRUCTURE_ERROR\n"));
        REQUIRE(contains(app.out.get_buffer(), "daemon unreachable\n"));
    }
}

TEST_CASE("Listing languages") {
    AppHarness app;

    ProgramOptions opts = AppHarness::make_options(VerbosityLevel::Normal);
    opts.action = ProgramOptions::Action::ListLanguages;

    REQUIRE(app.run(std::move(opts)) == 0);

    const std::string& out = app.out.get_buffer();

    REQUIRE(out.starts_with("LANGUAGE "));
    REQUIRE(contains(out, "python   restricted-python    -                             30s -      no\n"));
    REQUIRE(contains(out, "java     isolated-container   eclipse-temurin:21            30s java   yes\n"));
    REQUIRE(out.ends_with("6 languages\n"));
}

TEST_CASE("Checking backends") {
    AppHarness app;

    ProgramOptions opts = AppHarness::make_options(VerbosityLevel::Normal);
    opts.action = ProgramOptions::Action::Check;
    opts.python_binary = "polyexec-no-such-python";

    SECTION("A missing backend fails the check") {
        REQUIRE(app.run(opts) == 2);

        const std::string& out = app.out.get_buffer();
        REQUIRE(contains(out, "isolated-container: available\n"));
        REQUIRE(contains(out, "restricted-python: unavailable (python interpreter \"polyexec-no-such-python\" was "
                              "not found)\n"));
    }

    SECTION("Each executor is checked once") {
        app.runtime->reachable = false;

        REQUIRE(app.run(opts) == 2);

        const std::string& out = app.out.get_buffer();
        REQUIRE(out.find("isolated-container:") == out.rfind("isolated-container:"));
        REQUIRE(contains(out, "isolated-container: unavailable (daemon unreachable)\n"));
    }
}
