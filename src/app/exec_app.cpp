#include "app/exec_app.hpp"

#include <polyexec/common/error_types.hpp>
#include <polyexec/container/docker_cli.hpp>
#include <polyexec/execution/request.hpp>
#include <polyexec/language.hpp>
#include <polyexec/logging.hpp>

#include "output/plaintext_serializer.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <ios>
#include <iostream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace polyexec {

int to_exit_code(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return 0;
    case Outcome::CompileError:
    case Outcome::RuntimeError:
    case Outcome::Timeout:
        return 1;
    case Outcome::InfrastructureError:
        return UNSERVED_EXIT_CODE;
    }

    UNREACHABLE("Unknown outcome", static_cast<int>(outcome));
}

ExecApp::ExecApp(ProgramOptions opts)
    : App{std::move(opts)}
    , config_{OPTS.to_engine_config()}
    , registry_{ProfileRegistry::with_defaults()}
    , dispatcher_{ExecutionDispatcher::with_defaults(registry_, config_, std::make_shared<DockerCli>(config_))}
    , serializer_{std::make_unique<PlainTextSerializer>(stdout_sink_, stderr_sink_, OPTS.colorize_option,
                                                        OPTS.verbosity)} {}

ExecApp::ExecApp(ProgramOptions opts, std::shared_ptr<ContainerRuntime> runtime, Sink& out, Sink& err)
    : App{std::move(opts)}
    , config_{OPTS.to_engine_config()}
    , registry_{ProfileRegistry::with_defaults()}
    , dispatcher_{ExecutionDispatcher::with_defaults(registry_, config_, std::move(runtime))}
    , serializer_{std::make_unique<PlainTextSerializer>(out, err, OPTS.colorize_option, OPTS.verbosity)} {}

int ExecApp::run_impl() {
    int exit_code = 0;

    switch (OPTS.action) {
    case ProgramOptions::Action::Execute:
        exit_code = execute_source();
        break;
    case ProgramOptions::Action::ListLanguages:
        exit_code = list_languages();
        break;
    case ProgramOptions::Action::Check:
        exit_code = check_backends();
        break;
    }

    serializer_->finalize();

    return exit_code;
}

int ExecApp::execute_source() {
    auto lang = parse_language(OPTS.language_name);
    if (!lang) {
        serializer_->on_error(fmt::format("Unsupported language {:?}. See --list-languages.", OPTS.language_name));
        return UNSERVED_EXIT_CODE;
    }

    auto source = read_source();
    if (!source) {
        serializer_->on_error(source.error().message);
        return UNSERVED_EXIT_CODE;
    }

    ExecutionRequest request{
        .source = std::move(source.value()),
        .language = lang.value(),
        .timeout = OPTS.get_timeout(),
        .caps = OPTS.get_caps(),
    };

    auto executor = dispatcher_.find_executor(request.language);
    if (!executor) {
        serializer_->on_error(fmt::format("Language {} is not supported. See --list-languages.", request.language));
        return UNSERVED_EXIT_CODE;
    }

    serializer_->on_request(request, executor->get_name());

    // Failures past this point are the backend's; they are reported as an INFRASTRUCTURE_ERROR result
    ExecutionResult result = DEBUG_TIME(dispatcher_.execute_or_report(request));

    serializer_->on_result(result);

    return to_exit_code(result.outcome);
}

int ExecApp::list_languages() {
    serializer_->on_languages(describe_languages());

    return 0;
}

int ExecApp::check_backends() {
    bool all_available = true;
    std::set<const Executor*> checked;

    for (Language lang : dispatcher_.supported_languages()) {
        auto executor = dispatcher_.find_executor(lang);

        if (!checked.insert(executor.get()).second) {
            continue;
        }

        auto status = executor->check_availability();
        all_available = all_available && status.has_value();

        serializer_->on_availability(executor->get_name(), status);
    }

    return all_available ? 0 : UNSERVED_EXIT_CODE;
}

Expected<std::string, ExecutionError> ExecApp::read_source() const {
    std::ostringstream contents;

    if (OPTS.reads_stdin()) {
        contents << std::cin.rdbuf();

        if (std::cin.bad()) {
            return ExecutionError{ErrorKind::BadArgument, "Could not read the source from stdin"};
        }

        return contents.str();
    }

    std::ifstream file{*OPTS.file_name, std::ios::in | std::ios::binary};

    if (!file) {
        return ExecutionError{ErrorKind::BadArgument,
                              fmt::format("Could not open source file {:?}: {}", *OPTS.file_name, get_err_msg())};
    }

    contents << file.rdbuf();

    if (file.bad()) {
        return ExecutionError{ErrorKind::BadArgument,
                              fmt::format("Could not read source file {:?}: {}", *OPTS.file_name, get_err_msg())};
    }

    return contents.str();
}

std::vector<LanguageInfo> ExecApp::describe_languages() const {
    std::vector<LanguageInfo> infos;

    for (Language lang : dispatcher_.supported_languages()) {
        LanguageInfo info{
            .language = lang,
            .executor = std::string{dispatcher_.find_executor(lang)->get_name()},
            .image = {},
            .extension = {},
            .timeout = ExecutionRequest::DEFAULT_TIMEOUT,
            .has_compile_step = false,
        };

        // Only containerized languages have a profile
        if (auto profile = registry_.resolve(lang)) {
            const LanguageProfile& prof = profile.value().get();

            info.image = prof.image;
            info.extension = prof.extension;
            info.timeout = prof.default_timeout;
            info.has_compile_step = prof.has_compile_step();
        }

        infos.push_back(std::move(info));
    }

    return infos;
}

} // namespace polyexec
