#include "catch2_custom.hpp"

#include <polyexec/engine_config.hpp>

#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using polyexec::CommandLineArgs;
using polyexec::ProgramOptions;
using polyexec::VerbosityLevel;

namespace {

/// A source file that exists for the lifetime of the object
class TempSource
{
public:
    explicit TempSource(const std::string& contents)
        : path_{fs::temp_directory_path() / ("polyexec-cli-test-" + std::to_string(::getpid()) + ".c")} {
        std::ofstream{path_} << contents;
    }

    ~TempSource() { fs::remove(path_); }

    TempSource(const TempSource&) = delete;
    TempSource& operator=(const TempSource&) = delete;

    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

polyexec::Expected<ProgramOptions, std::string> parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"polyexec"};
    argv.insert(argv.end(), args.begin(), args.end());

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Parsing sizes") {
    REQUIRE(ProgramOptions::parse_size("1024") == 1024ULL);
    REQUIRE(ProgramOptions::parse_size("4k") == 4096ULL);
    REQUIRE(ProgramOptions::parse_size("4K") == 4096ULL);
    REQUIRE(ProgramOptions::parse_size("256m") == 256ULL * 1024 * 1024);
    REQUIRE(ProgramOptions::parse_size("2G") == 2ULL * 1024 * 1024 * 1024);
    REQUIRE(ProgramOptions::parse_size("0") == 0ULL);

    SECTION("Invalid sizes") {
        for (const char* str : {"", "k", "-1", "1.5m", "12x", "1kb", " 1"}) {
            INFO(str);
            REQUIRE(ProgramOptions::parse_size(str).has_error());
        }
    }

    SECTION("Overflow is detected") {
        REQUIRE(ProgramOptions::parse_size("18446744073709551615") == UINT64_MAX);
        REQUIRE(ProgramOptions::parse_size("18446744073709551616").has_error());
        REQUIRE(ProgramOptions::parse_size("17179869184g").has_error());
    }
}

TEST_CASE("Parsing an execution request") {
    TempSource source{"int main(void) { return 0; }\n"};

    auto opts = parse({"c", source.str().c_str(), "-t", "2.5", "-m", "256m", "--cpus", "0.5"});

    REQUIRE(opts);
    REQUIRE(opts->action == ProgramOptions::Action::Execute);
    REQUIRE(opts->language_name == "c");
    REQUIRE(opts->file_name == source.str());
    REQUIRE_FALSE(opts->reads_stdin());

    REQUIRE(opts->get_timeout() == std::chrono::milliseconds{2500});
    REQUIRE(opts->get_caps().memory_bytes == 256ULL * 1024 * 1024);
    REQUIRE(opts->get_caps().cpu_share == 0.5);
    REQUIRE(opts->verbosity == VerbosityLevel::Normal);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Auto);
}

TEST_CASE("Source from stdin") {
    SECTION("No file") {
        auto opts = parse({"python"});

        REQUIRE(opts);
        REQUIRE(opts->reads_stdin());
    }

    SECTION("Explicit dash") {
        auto opts = parse({"rust", "-"});

        REQUIRE(opts);
        REQUIRE(opts->reads_stdin());
    }

    // Defaults to the language's own limits
    auto opts = parse({"java"});
    REQUIRE(opts);
    REQUIRE_FALSE(opts->get_timeout().has_value());
    REQUIRE(opts->get_caps() == polyexec::ResourceCaps{});
}

TEST_CASE("Verbosity and color flags") {
    REQUIRE(parse({"c", "-v"})->verbosity == VerbosityLevel::Verbose);
    REQUIRE(parse({"c", "-v", "-v"})->verbosity == VerbosityLevel::Max);
    REQUIRE(parse({"c", "-q"})->verbosity == VerbosityLevel::Quiet);
    REQUIRE(parse({"c", "-q", "-q"})->verbosity == VerbosityLevel::Silent);
    REQUIRE(parse({"c", "--silent"})->verbosity == VerbosityLevel::Silent);

    REQUIRE(parse({"c", "-v", "-v", "-v"}).has_error());

    REQUIRE(parse({"c", "--color", "never"})->colorize_option == ProgramOptions::ColorizeOpt::Never);
    REQUIRE(parse({"c", "-c", "always"})->colorize_option == ProgramOptions::ColorizeOpt::Always);
    REQUIRE(parse({"c", "--color", "sometimes"}).has_error());
}

TEST_CASE("Listing and checking need no language") {
    auto list = parse({"--list-languages"});
    REQUIRE(list);
    REQUIRE(list->action == ProgramOptions::Action::ListLanguages);

    auto check = parse({"--check"});
    REQUIRE(check);
    REQUIRE(check->action == ProgramOptions::Action::Check);
}

TEST_CASE("Invalid arguments are described") {
    auto error_of = [](std::initializer_list<const char*> args) {
        auto opts = parse(args);
        REQUIRE(opts.has_error());
        return opts.error();
    };

    REQUIRE(error_of({}) == "No language specified");
    REQUIRE(error_of({"c", "/nonexistent/polyexec/source.c"}).find("does not exist") != std::string::npos);
    REQUIRE(error_of({"c", "/tmp"}).find("is not a regular file") != std::string::npos);

    REQUIRE(error_of({"c", "-t", "abc"}).find("is not a valid number") != std::string::npos);
    REQUIRE(error_of({"c", "-t", "0"}).starts_with("Timeout must be a positive number"));
    REQUIRE(error_of({"c", "-t", "inf"}).starts_with("Timeout must be a positive number"));

    REQUIRE(error_of({"c", "-m", "1m"}).starts_with("Memory limit must be at least"));
    REQUIRE(error_of({"c", "-m", "lots"}).find("is not a number") != std::string::npos);

    REQUIRE(error_of({"c", "--cpus", "0"}).starts_with("CPU share must be a positive number"));
    REQUIRE(error_of({"c", "--capture-limit", "0"}) == "Capture limit must be at least 1 byte");
    REQUIRE(error_of({"c", "--docker", ""}) == "Executable names must not be empty");
    REQUIRE(error_of({"c", "--workspace-root", "/nonexistent/polyexec"}).find("does not exist") != std::string::npos);
}

TEST_CASE("Engine configuration from options") {
    auto opts = parse({"--check", "--docker", "podman", "--python", "/usr/bin/python3.12", "--capture-limit", "1k",
                       "--grace", "250", "--workspace-root", "/tmp", "--pull"});

    REQUIRE(opts);

    const polyexec::EngineConfig config = opts->to_engine_config();

    REQUIRE(config.docker_binary == "podman");
    REQUIRE(config.python_binary == "/usr/bin/python3.12");
    REQUIRE(config.capture_limit == 1024);
    REQUIRE(config.termination_grace == 250ms);
    REQUIRE(config.workspace_root == fs::path{"/tmp"});
    REQUIRE(config.pull_missing_images);

    SECTION("Untouched options keep the engine defaults") {
        const polyexec::EngineConfig defaults = parse({"--check"})->to_engine_config();

        REQUIRE(defaults.docker_binary == polyexec::EngineConfig{}.docker_binary);
        REQUIRE(defaults.capture_limit == polyexec::EngineConfig{}.capture_limit);
        REQUIRE(defaults.termination_grace == polyexec::EngineConfig{}.termination_grace);
        REQUIRE(defaults.workspace_root.empty());
        REQUIRE_FALSE(defaults.pull_missing_images);
    }
}

TEST_CASE("Timeouts round up to whole milliseconds") {
    ProgramOptions opts;

    opts.timeout_seconds = 0.0001;
    REQUIRE(opts.get_timeout() == 1ms);

    opts.timeout_seconds = 10;
    REQUIRE(opts.get_timeout() == 10s);
}
