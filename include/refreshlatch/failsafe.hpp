#ifndef REFRESHLATCH_FAILSAFE_HPP
#define REFRESHLATCH_FAILSAFE_HPP

#include <exception>
#include <functional>
#include <string_view>
#include <utility>

#include "refreshlatch/logging.hpp"

namespace refreshlatch::failsafe {

    using ErrorHandler = std::function<void(std::string_view context, std::string_view message)>;

    // Runs `fn` at a boundary exceptions must not cross (C event-loop dispatch).
    // Failures go to `on_error`, or to the error log when no handler is set.
    template <typename F>
    [[nodiscard]] bool guard(F&& fn, const ErrorHandler& on_error, std::string_view context) noexcept {
        const auto report = [&](std::string_view message) noexcept {
            try {
                if (on_error) {
                    on_error(context, message);
                } else {
                    error_log(context, message);
                }
            } catch (...) {}
        };
        try {
            std::forward<F>(fn)();
            return true;
        } catch (const std::exception& ex) {
            report(ex.what());
        } catch (...) {
            report("unknown exception");
        }
        return false;
    }

} // namespace refreshlatch::failsafe

#endif // REFRESHLATCH_FAILSAFE_HPP
