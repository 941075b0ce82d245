#ifndef REFRESHLATCH_LOGGING_HPP
#define REFRESHLATCH_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace refreshlatch {

    enum class LogLevel {
        kDebug,
        kError,
    };

    using LogSink = void (*)(std::string_view entry);

    // "[refreshlatch][<level>] <context>: <message> @<file>:<line> <function>"
    std::string format_log_entry(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    // Sinks are process-wide and are expected to be installed once by the host
    // before any latch starts reporting.
    void        set_debug_log_sink(LogSink sink);
    void        clear_debug_log_sink();
    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_error_log_sink(LogSink sink);
    void        clear_error_log_sink();
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

} // namespace refreshlatch

#endif // REFRESHLATCH_LOGGING_HPP
