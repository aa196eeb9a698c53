#include "catch2_custom.hpp"

#include <polyexec/common/error_types.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/dispatcher.hpp>
#include <polyexec/execution/executor.hpp>
#include <polyexec/execution/isolated_container_executor.hpp>
#include <polyexec/execution/request.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/language.hpp>
#include <polyexec/profiles/profile_registry.hpp>

#include "fake_runtime.hpp"

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using polyexec::EngineConfig;
using polyexec::ErrorKind;
using polyexec::ExecutionDispatcher;
using polyexec::ExecutionError;
using polyexec::ExecutionRequest;
using polyexec::ExecutionResult;
using polyexec::Expected;
using polyexec::Language;
using polyexec::Outcome;
using polyexec::ProfileRegistry;
using polyexec::test::exited;
using polyexec::test::FakeRuntime;

using Argv = std::vector<std::string>;

namespace {

ExecutionRequest make_request(Language lang, std::string source) {
    return {.source = std::move(source), .language = lang, .timeout = 5s, .caps = {}};
}

/// Answers every request with a fixed result and counts how often it was asked
class CannedExecutor : public polyexec::Executor
{
public:
    explicit CannedExecutor(ExecutionResult result)
        : result_{std::move(result)} {}

    std::string_view get_name() const override { return "canned"; }

    Expected<ExecutionResult, ExecutionError> execute(const ExecutionRequest& /*request*/) override {
        ++calls;
        return result_;
    }

    Expected<void, ExecutionError> check_availability() override { return {}; }

    std::atomic<int> calls = 0;

private:
    ExecutionResult result_;
};

} // namespace

TEST_CASE("Default routing") {
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    auto runtime = std::make_shared<FakeRuntime>();

    const auto dispatcher = ExecutionDispatcher::with_defaults(registry, config, runtime);

    REQUIRE(dispatcher.find_executor(Language::Python)->get_name() == "restricted-python");

    for (Language lang : registry.supported_languages()) {
        INFO(fmt::format("{}", lang));
        REQUIRE(dispatcher.find_executor(lang)->get_name() == "isolated-container");
    }

    // One container executor serves every containerized language
    REQUIRE(dispatcher.find_executor(Language::C) == dispatcher.find_executor(Language::Rust));

    REQUIRE(dispatcher.supported_languages().size() == polyexec::ALL_LANGUAGES.size());
}

TEST_CASE("Unsupported languages are rejected before any unit exists") {
    const EngineConfig config;
    auto runtime = std::make_shared<FakeRuntime>();

    ProfileRegistry registry;
    registry.insert(ProfileRegistry::with_defaults().resolve(Language::C)->get());

    const auto dispatcher = ExecutionDispatcher::with_defaults(registry, config, runtime);

    auto res = dispatcher.execute(make_request(Language::Rust, "fn main() {}"));

    REQUIRE(res.has_error());
    REQUIRE(res.error().kind == ErrorKind::UnsupportedLanguage);
    REQUIRE(res.error().message == "language rust is not supported");

    REQUIRE(runtime->provisioned_specs().empty());
    REQUIRE(runtime->mounts_seen().empty());

    SECTION("An empty dispatcher supports nothing") {
        const ExecutionDispatcher empty;

        REQUIRE(empty.supported_languages().empty());
        REQUIRE(empty.find_executor(Language::C) == nullptr);
        REQUIRE(empty.execute(make_request(Language::C, "")).error().kind == ErrorKind::UnsupportedLanguage);
    }
}

TEST_CASE("Requests reach the routed executor") {
    ExecutionDispatcher dispatcher;

    auto canned = std::make_shared<CannedExecutor>(
        ExecutionResult{.stdout_text = "42\n", .stderr_text = "", .exit_code = 0, .elapsed = 1ms,
                        .outcome = Outcome::Success, .truncated = false});

    dispatcher.register_executor(Language::Cpp, canned);

    auto res = dispatcher.execute(make_request(Language::Cpp, "int main() {}"));

    REQUIRE(res);
    REQUIRE(res->stdout_text == "42\n");
    REQUIRE(canned->calls.load() == 1);

    SECTION("Registering again replaces the route") {
        auto other = std::make_shared<CannedExecutor>(ExecutionResult{});
        dispatcher.register_executor(Language::Cpp, other);

        REQUIRE(dispatcher.execute(make_request(Language::Cpp, "int main() {}")));
        REQUIRE(canned->calls.load() == 1);
        REQUIRE(other->calls.load() == 1);
    }
}

TEST_CASE("Container requests through the dispatcher") {
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    auto runtime = std::make_shared<FakeRuntime>();

    runtime->on_exec = [](const Argv& argv, auto /*deadline*/) -> Expected<polyexec::CommandOutcome, ExecutionError> {
        if (argv.front() == "rustc") {
            return exited(0);
        }
        return exited(0, "Hello, World!\n");
    };

    const auto dispatcher = ExecutionDispatcher::with_defaults(registry, config, runtime);

    auto res = dispatcher.execute(make_request(Language::Rust, "fn main() { println!(\"Hello, World!\"); }"));

    REQUIRE(res);
    REQUIRE(res->outcome == Outcome::Success);
    REQUIRE(res->stdout_text == "Hello, World!\n");
    REQUIRE(res->exit_code == 0);
    REQUIRE(runtime->live_units() == 0);

    SECTION("The profile's timeout applies when the request has none") {
        std::vector<std::chrono::steady_clock::duration> budgets;
        runtime->on_exec = [&budgets](const Argv& /*argv*/, std::chrono::steady_clock::time_point deadline)
            -> Expected<polyexec::CommandOutcome, ExecutionError> {
            budgets.push_back(deadline - std::chrono::steady_clock::now());
            return exited(0);
        };

        auto request = make_request(Language::C, "int main(void) { return 0; }");
        request.timeout = std::nullopt;

        REQUIRE(dispatcher.execute(request));
        REQUIRE(budgets.size() == 2);
        REQUIRE(budgets[0] > 25s);
        REQUIRE(budgets[0] <= 30s);
    }
}

TEST_CASE("Failures are reported as results") {
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->reachable = false;

    const auto dispatcher = ExecutionDispatcher::with_defaults(registry, config, runtime);

    SECTION("Infrastructure errors") {
        ExecutionResult result = dispatcher.execute_or_report(make_request(Language::Java, "class A {}"));

        REQUIRE(result.outcome == Outcome::InfrastructureError);
        REQUIRE(result.stderr_text == "daemon unreachable");
        REQUIRE_FALSE(result.exit_code.has_value());
    }

    SECTION("Unsupported languages") {
        ExecutionDispatcher empty;

        ExecutionResult result = empty.execute_or_report(make_request(Language::C, "int main(void) {}"));

        REQUIRE(result.outcome == Outcome::InfrastructureError);
        REQUIRE(result.stderr_text == "language c is not supported");
    }

    REQUIRE(runtime->live_units() == 0);
}

TEST_CASE("Concurrent requests are isolated from each other") {
    constexpr std::size_t NUM_REQUESTS = 8;

    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    auto runtime = std::make_shared<FakeRuntime>();

    // Every step takes a little while so the units overlap
    runtime->on_exec = [](const Argv& argv, auto /*deadline*/) -> Expected<polyexec::CommandOutcome, ExecutionError> {
        std::this_thread::sleep_for(20ms);
        if (argv.front() == "gcc") {
            return exited(0);
        }
        return exited(0, "done\n");
    };

    const auto dispatcher = ExecutionDispatcher::with_defaults(registry, config, runtime);

    std::vector<ExecutionResult> results(NUM_REQUESTS);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&dispatcher, &results, i] {
            results[i] = dispatcher.execute_or_report(
                make_request(Language::C, fmt::format("int main(void) {{ return {}; }}", i)));
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        REQUIRE(result.outcome == Outcome::Success);
    }

    REQUIRE(runtime->provisioned_specs().size() == NUM_REQUESTS);
    REQUIRE(runtime->live_units() == 0);

    // Every request had its own workspace
    const auto mounts = runtime->mounts_seen();
    REQUIRE(std::set(mounts.begin(), mounts.end()).size() == NUM_REQUESTS);
}
