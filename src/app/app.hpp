#pragma once

#include <polyexec/common/class_traits.hpp>

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <optional>
#include <utility>

namespace polyexec {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit status of the app; INTERNAL_ERROR_EXIT_CODE if an exception escaped
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(INTERNAL_ERROR_EXIT_CODE);
    }

    static constexpr int INTERNAL_ERROR_EXIT_CODE = 3;

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace polyexec
