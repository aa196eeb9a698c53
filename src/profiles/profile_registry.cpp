#include <polyexec/profiles/profile_registry.hpp>

#include <polyexec/logging.hpp>

#include <chrono>
#include <functional>
#include <utility>
#include <vector>

namespace polyexec {

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

LanguageProfile make_c_profile() {
    return {
        .language = Language::C,
        .image = "gcc:13",
        .extension = "c",
        .compile_command = CommandTemplate{{"gcc", "-O2", "-std=c17", "-o", "{dir}/program", "{source}", "-lm"}},
        .run_command = CommandTemplate{{"{dir}/program"}},
        .default_timeout = std::chrono::seconds{30},
        .default_caps = {.memory_bytes = 512 * MiB, .cpu_share = 1.0},
        .env = {},
        .naming = SourceNaming::Fixed,
    };
}

LanguageProfile make_cpp_profile() {
    return {
        .language = Language::Cpp,
        .image = "gcc:13",
        .extension = "cpp",
        .compile_command = CommandTemplate{{"g++", "-O2", "-std=c++20", "-o", "{dir}/program", "{source}"}},
        .run_command = CommandTemplate{{"{dir}/program"}},
        .default_timeout = std::chrono::seconds{30},
        .default_caps = {.memory_bytes = 512 * MiB, .cpu_share = 1.0},
        .env = {},
        .naming = SourceNaming::Fixed,
    };
}

LanguageProfile make_java_profile() {
    return {
        .language = Language::Java,
        .image = "eclipse-temurin:21",
        .extension = "java",
        .compile_command = CommandTemplate{{"javac", "-d", "{dir}/classes", "{source}"}},
        .run_command = CommandTemplate{{"java", "-cp", "{dir}/classes", "{stem}"}},
        .default_timeout = std::chrono::seconds{30},
        .default_caps = {.memory_bytes = 1024 * MiB, .cpu_share = 1.0},
        // The JVM sizes its heap from the host otherwise, and the unit's memory cap kills it
        .env = {"JAVA_TOOL_OPTIONS=-XX:+UseSerialGC -XX:MaxRAMPercentage=75"},
        .naming = SourceNaming::JavaPublicClass,
    };
}

LanguageProfile make_csharp_profile() {
    return {
        .language = Language::CSharp,
        .image = "mono:6.12",
        .extension = "cs",
        .compile_command = CommandTemplate{{"mcs", "-out:{dir}/program.exe", "{source}"}},
        .run_command = CommandTemplate{{"mono", "{dir}/program.exe"}},
        .default_timeout = std::chrono::seconds{30},
        .default_caps = {.memory_bytes = 512 * MiB, .cpu_share = 1.0},
        .env = {},
        .naming = SourceNaming::Fixed,
    };
}

LanguageProfile make_rust_profile() {
    return {
        .language = Language::Rust,
        .image = "rust:1.79-slim",
        .extension = "rs",
        .compile_command = CommandTemplate{{"rustc", "-O", "-o", "{dir}/program", "{source}"}},
        .run_command = CommandTemplate{{"{dir}/program"}},
        .default_timeout = std::chrono::seconds{30},
        .default_caps = {.memory_bytes = 1024 * MiB, .cpu_share = 1.0},
        .env = {},
        .naming = SourceNaming::Fixed,
    };
}

} // namespace

ProfileRegistry ProfileRegistry::with_defaults() {
    ProfileRegistry registry;

    registry.insert(make_c_profile());
    registry.insert(make_cpp_profile());
    registry.insert(make_java_profile());
    registry.insert(make_csharp_profile());
    registry.insert(make_rust_profile());

    return registry;
}

void ProfileRegistry::insert(LanguageProfile profile) {
    Language lang = profile.language;

    LOG_DEBUG("Registering profile for {} (image {:?})", lang, profile.image);

    profiles_.insert_or_assign(lang, std::move(profile));
}

Result<std::reference_wrapper<const LanguageProfile>> ProfileRegistry::resolve(Language lang) const {
    auto iter = profiles_.find(lang);

    if (iter == profiles_.end()) {
        LOG_DEBUG("No profile registered for {}", lang);
        return ErrorKind::UnsupportedLanguage;
    }

    return std::cref(iter->second);
}

bool ProfileRegistry::contains(Language lang) const {
    return profiles_.contains(lang);
}

std::vector<Language> ProfileRegistry::supported_languages() const {
    std::vector<Language> result;
    result.reserve(profiles_.size());

    for (const auto& [lang, profile] : profiles_) {
        result.push_back(lang);
    }

    return result;
}

} // namespace polyexec
