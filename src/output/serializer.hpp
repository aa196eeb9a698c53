#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <polyexec/common/class_traits.hpp>
#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/execution/request.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/language.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

/// One row of the language listing
struct LanguageInfo
{
    Language language;
    std::string executor;
    std::string image;     ///< empty if the language does not run in a container
    std::string extension; ///< empty if the language does not run in a container
    std::chrono::seconds timeout;
    bool has_compile_step = false;
};

class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_request(const ExecutionRequest& request, std::string_view executor_name) = 0;
    virtual void on_result(const ExecutionResult& result) = 0;
    virtual void on_languages(const std::vector<LanguageInfo>& languages) = 0;
    virtual void on_availability(std::string_view executor_name, const Expected<void, ExecutionError>& status) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace polyexec
