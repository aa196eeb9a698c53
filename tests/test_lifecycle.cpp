#include "catch2_custom.hpp"

#include <polyexec/common/error_types.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/lifecycle_manager.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/language.hpp>
#include <polyexec/profiles/language_profile.hpp>
#include <polyexec/profiles/profile_registry.hpp>

#include "fake_runtime.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using polyexec::EngineConfig;
using polyexec::ErrorKind;
using polyexec::Language;
using polyexec::LanguageProfile;
using polyexec::LifecycleManager;
using polyexec::ProfileRegistry;
using polyexec::ResourceCaps;
using polyexec::test::exited;
using polyexec::test::FakeRuntime;
using polyexec::test::timed_out;
using enum polyexec::LifecycleState;

using Argv = std::vector<std::string>;

namespace {

bool is_compile(const Argv& argv) {
    return !argv.empty() && (argv[0] == "gcc" || argv[0] == "javac");
}

} // namespace

TEST_CASE("Lifecycle transitions") {
    using polyexec::is_valid_transition;

    REQUIRE(is_valid_transition(Created, Provisioned));
    REQUIRE(is_valid_transition(Provisioned, SourceWritten));
    REQUIRE(is_valid_transition(SourceWritten, Compiling));
    REQUIRE(is_valid_transition(SourceWritten, Running));
    REQUIRE(is_valid_transition(Compiling, Compiled));
    REQUIRE(is_valid_transition(Compiling, CompileFailed));
    REQUIRE(is_valid_transition(Compiling, TimedOut));
    REQUIRE(is_valid_transition(Compiled, Running));
    REQUIRE(is_valid_transition(Running, Succeeded));
    REQUIRE(is_valid_transition(Running, RuntimeError));
    REQUIRE(is_valid_transition(Running, TimedOut));

    SECTION("Every state but the last may be torn down") {
        for (auto state : {Created, Provisioned, SourceWritten, Compiling, Compiled, CompileFailed, Running, Succeeded,
                           RuntimeError, TimedOut}) {
            REQUIRE(is_valid_transition(state, TornDown));
        }
        REQUIRE_FALSE(is_valid_transition(TornDown, TornDown));
    }

    SECTION("Steps cannot be skipped or repeated") {
        REQUIRE_FALSE(is_valid_transition(Created, Running));
        REQUIRE_FALSE(is_valid_transition(Provisioned, Compiling));
        REQUIRE_FALSE(is_valid_transition(CompileFailed, Running));
        REQUIRE_FALSE(is_valid_transition(Succeeded, Running));
        REQUIRE_FALSE(is_valid_transition(TimedOut, Running));
        REQUIRE_FALSE(is_valid_transition(TornDown, Created));
    }
}

TEST_CASE("A compiled program runs to completion") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    const LanguageProfile& c_profile = registry.resolve(Language::C)->get();

    std::string seen_source;
    runtime.on_exec = [&](const Argv& argv, auto /*deadline*/) -> polyexec::Expected<polyexec::CommandOutcome,
                                                                                      polyexec::ExecutionError> {
        if (is_compile(argv)) {
            // The source is on the host side of the mount by the time the compiler runs
            std::ifstream file{runtime.mounts_seen().back() / "source.c", std::ios::binary};
            seen_source.assign(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
            return exited(0);
        }
        return exited(0, "Hello, World!\n");
    };

    LifecycleManager manager{runtime, c_profile, config};
    auto raw = manager.run("int main(void) { return 0; }", 5s, {});

    REQUIRE(raw);
    REQUIRE(raw->compile.has_value());
    REQUIRE(raw->compile->exit_code == 0);
    REQUIRE(raw->run.has_value());
    REQUIRE(raw->run->stdout_capture.data == "Hello, World!\n");

    REQUIRE(seen_source == "int main(void) { return 0; }");

    REQUIRE(manager.get_state() == TornDown);
    REQUIRE(manager.history() ==
            std::vector{Created, Provisioned, SourceWritten, Compiling, Compiled, Running, Succeeded, TornDown});
    REQUIRE_FALSE(manager.get_unit().has_value());

    REQUIRE(runtime.exec_calls() ==
            std::vector<Argv>{
                {"gcc", "-O2", "-std=c17", "-o", "/workspace/program", "/workspace/source.c", "-lm"},
                {"/workspace/program"},
            });

    // Nothing survives the request
    REQUIRE(runtime.live_units() == 0);
    REQUIRE(runtime.terminate_calls() == 0);
    REQUIRE_FALSE(fs::exists(runtime.mounts_seen().back()));
}

TEST_CASE("Units are provisioned from the profile and request") {
    FakeRuntime runtime;
    EngineConfig config;
    config.termination_grace = 1500ms;

    const auto registry = ProfileRegistry::with_defaults();
    const LanguageProfile& java = registry.resolve(Language::Java)->get();

    LifecycleManager manager{runtime, java, config};
    REQUIRE(manager.run("public class Greeter {}", 10s, ResourceCaps{.memory_bytes = std::nullopt, .cpu_share = 0.5}));

    const auto specs = runtime.provisioned_specs();
    REQUIRE(specs.size() == 1);

    const polyexec::UnitSpec& spec = specs[0];
    REQUIRE(spec.image == "eclipse-temurin:21");
    REQUIRE(spec.mount_point == "/workspace");
    REQUIRE(spec.caps.memory_bytes == java.default_caps.memory_bytes);
    REQUIRE(spec.caps.cpu_share == 0.5);
    REQUIRE(spec.env == java.env);
    // ceil(10s + 1.5s) + slack
    REQUIRE(spec.max_lifetime == 12s + LifecycleManager::UNIT_LIFETIME_SLACK);

    SECTION("Java steps name the public class") {
        REQUIRE(runtime.exec_calls() ==
                std::vector<Argv>{
                    {"javac", "-d", "/workspace/classes", "/workspace/Greeter.java"},
                    {"java", "-cp", "/workspace/classes", "Greeter"},
                });
    }
}

TEST_CASE("Compile failures skip the run step") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    runtime.on_exec = [](const Argv& argv, auto /*deadline*/) -> polyexec::Expected<polyexec::CommandOutcome,
                                                                                    polyexec::ExecutionError> {
        if (is_compile(argv)) {
            return exited(1, "", "source.c:1:1: error: expected ';'\n");
        }
        return exited(0, "should never run");
    };

    LifecycleManager manager{runtime, registry.resolve(Language::C)->get(), config};
    auto raw = manager.run("int main(void) { return 0 }", 5s, {});

    REQUIRE(raw);
    REQUIRE(raw->compile->exit_code == 1);
    REQUIRE_FALSE(raw->run.has_value());
    REQUIRE(runtime.exec_calls().size() == 1);

    REQUIRE(manager.history() == std::vector{Created, Provisioned, SourceWritten, Compiling, CompileFailed, TornDown});
    REQUIRE(runtime.live_units() == 0);
}

TEST_CASE("Programs exiting non-zero are runtime errors") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    runtime.on_exec = [](const Argv& argv, auto /*deadline*/) -> polyexec::Expected<polyexec::CommandOutcome,
                                                                                    polyexec::ExecutionError> {
        if (is_compile(argv)) {
            return exited(0);
        }
        return exited(139, "", "Segmentation fault\n");
    };

    LifecycleManager manager{runtime, registry.resolve(Language::C)->get(), config};
    auto raw = manager.run("int main(void) { return *(int*)0; }", 5s, {});

    REQUIRE(raw);
    REQUIRE(raw->run->exit_code == 139);
    REQUIRE(manager.history().at(manager.history().size() - 2) == RuntimeError);
    REQUIRE(runtime.terminate_calls() == 0);
}

TEST_CASE("One deadline covers compile and run") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    std::vector<std::chrono::steady_clock::time_point> deadlines;
    runtime.on_exec = [&deadlines](const Argv& /*argv*/, std::chrono::steady_clock::time_point deadline)
        -> polyexec::Expected<polyexec::CommandOutcome, polyexec::ExecutionError> {
        deadlines.push_back(deadline);
        return exited(0);
    };

    const auto before = std::chrono::steady_clock::now();

    LifecycleManager manager{runtime, registry.resolve(Language::Rust)->get(), config};
    REQUIRE(manager.run("fn main() {}", 3s, {}));

    REQUIRE(deadlines.size() == 2);
    REQUIRE(deadlines[0] == deadlines[1]);
    REQUIRE(deadlines[0] >= before + 3s);
    REQUIRE(deadlines[0] <= std::chrono::steady_clock::now() + 3s);
}

TEST_CASE("Timed out units are stopped before removal") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    SECTION("While running") {
        runtime.on_exec = [](const Argv& argv, auto /*deadline*/) -> polyexec::Expected<polyexec::CommandOutcome,
                                                                                        polyexec::ExecutionError> {
            if (is_compile(argv)) {
                return exited(0);
            }
            return timed_out("tick\n");
        };

        LifecycleManager manager{runtime, registry.resolve(Language::C)->get(), config};
        auto raw = manager.run("int main(void) { for (;;); }", 1s, {});

        REQUIRE(raw);
        REQUIRE(raw->run->timed_out);
        REQUIRE(raw->run->stdout_capture.data == "tick\n");
        REQUIRE(manager.history() ==
                std::vector{Created, Provisioned, SourceWritten, Compiling, Compiled, Running, TimedOut, TornDown});
    }

    SECTION("While compiling") {
        runtime.on_exec = [](const Argv& /*argv*/, auto /*deadline*/)
            -> polyexec::Expected<polyexec::CommandOutcome, polyexec::ExecutionError> { return timed_out(); };

        LifecycleManager manager{runtime, registry.resolve(Language::C)->get(), config};
        auto raw = manager.run("int main(void) { return 0; }", 1s, {});

        REQUIRE(raw);
        REQUIRE(raw->compile->timed_out);
        REQUIRE_FALSE(raw->run.has_value());
        REQUIRE(manager.history() == std::vector{Created, Provisioned, SourceWritten, Compiling, TimedOut, TornDown});
    }

    REQUIRE(runtime.terminate_calls() == 1);
    REQUIRE(runtime.destroy_calls() == 1);
    REQUIRE(runtime.live_units() == 0);
}

TEST_CASE("Provisioning failures leave nothing behind") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    runtime.provision_error = polyexec::ExecutionError{ErrorKind::InfrastructureError, "no space left on device"};

    LifecycleManager manager{runtime, registry.resolve(Language::Cpp)->get(), config};
    auto raw = manager.run("int main() {}", 5s, {});

    REQUIRE(raw.has_error());
    REQUIRE(raw.error().kind == ErrorKind::InfrastructureError);
    REQUIRE(raw.error().message == "no space left on device");

    REQUIRE(manager.history() == std::vector{Created, TornDown});
    REQUIRE(runtime.exec_calls().empty());
    REQUIRE(runtime.destroy_calls() == 0);
    REQUIRE(runtime.live_units() == 0);

    REQUIRE(runtime.mounts_seen().size() == 1);
    REQUIRE_FALSE(fs::exists(runtime.mounts_seen()[0]));
}

TEST_CASE("Exec failures still tear down the unit") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    runtime.on_exec = [](const Argv& /*argv*/, auto /*deadline*/)
        -> polyexec::Expected<polyexec::CommandOutcome, polyexec::ExecutionError> {
        return polyexec::ExecutionError{ErrorKind::InfrastructureError, "connection reset"};
    };

    LifecycleManager manager{runtime, registry.resolve(Language::CSharp)->get(), config};
    auto raw = manager.run("class P { static void Main() {} }", 5s, {});

    REQUIRE(raw.has_error());
    REQUIRE(raw.error().kind == ErrorKind::InfrastructureError);
    REQUIRE(manager.history() == std::vector{Created, Provisioned, SourceWritten, Compiling, TornDown});
    REQUIRE(runtime.live_units() == 0);
    REQUIRE_FALSE(fs::exists(runtime.mounts_seen().back()));
}

TEST_CASE("Unit removal is retried once") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    const LanguageProfile& profile = registry.resolve(Language::C)->get();

    SECTION("A transient failure is recovered") {
        runtime.destroy_failures = 1;

        LifecycleManager manager{runtime, profile, config};
        auto raw = manager.run("int main(void) { return 0; }", 5s, {});

        REQUIRE(raw);
        REQUIRE(runtime.destroy_calls() == 2);
        REQUIRE(runtime.live_units() == 0);
    }

    SECTION("A persistent failure does not change the outcome") {
        runtime.destroy_failures = 2;

        LifecycleManager manager{runtime, profile, config};
        auto raw = manager.run("int main(void) { return 0; }", 5s, {});

        REQUIRE(raw);
        REQUIRE(raw->run->exit_code == 0);
        REQUIRE(manager.get_state() == TornDown);
        REQUIRE(runtime.destroy_calls() == 2);
        REQUIRE(runtime.live_units() == 1);
    }
}

TEST_CASE("Missing images") {
    FakeRuntime runtime;
    EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();
    const LanguageProfile& rust = registry.resolve(Language::Rust)->get();

    runtime.image_present = false;

    SECTION("Fail when pulling is disabled") {
        LifecycleManager manager{runtime, rust, config};
        auto raw = manager.run("fn main() {}", 5s, {});

        REQUIRE(raw.has_error());
        REQUIRE(raw.error().kind == ErrorKind::InfrastructureError);
        REQUIRE(raw.error().message.find("rust:1.79-slim") != std::string::npos);
        REQUIRE(runtime.pulled_images().empty());
        REQUIRE(runtime.provisioned_specs().empty());
    }

    SECTION("Are pulled when enabled") {
        config.pull_missing_images = true;

        LifecycleManager manager{runtime, rust, config};
        REQUIRE(manager.run("fn main() {}", 5s, {}));

        REQUIRE(runtime.pulled_images() == std::vector<std::string>{"rust:1.79-slim"});
        REQUIRE(runtime.provisioned_specs().size() == 1);
    }

    SECTION("Pull failures are infrastructure errors") {
        config.pull_missing_images = true;
        runtime.pull_error = polyexec::ExecutionError{ErrorKind::InfrastructureError, "manifest unknown"};

        LifecycleManager manager{runtime, rust, config};
        auto raw = manager.run("fn main() {}", 5s, {});

        REQUIRE(raw.has_error());
        REQUIRE(raw.error().kind == ErrorKind::InfrastructureError);
        REQUIRE(runtime.provisioned_specs().empty());
    }

    SECTION("An unreachable daemon is reported") {
        runtime.reachable = false;

        LifecycleManager manager{runtime, rust, config};
        auto raw = manager.run("fn main() {}", 5s, {});

        REQUIRE(raw.has_error());
        REQUIRE(raw.error().message == "daemon unreachable");
        REQUIRE(manager.history() == std::vector{Created, TornDown});
    }
}

TEST_CASE("A manager runs only once") {
    FakeRuntime runtime;
    const EngineConfig config;
    const auto registry = ProfileRegistry::with_defaults();

    LifecycleManager manager{runtime, registry.resolve(Language::C)->get(), config};
    REQUIRE(manager.run("int main(void) { return 0; }", 5s, {}));

    REQUIRE_THROWS(manager.run("int main(void) { return 0; }", 5s, {}));
}
