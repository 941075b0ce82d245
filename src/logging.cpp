#include "refreshlatch/logging.hpp"

namespace refreshlatch {

    namespace {

        LogSink          debug_sink = nullptr;
        LogSink          error_sink = nullptr;

        std::string_view level_tag(LogLevel level) {
            switch (level) {
                case LogLevel::kDebug: return "[refreshlatch][debug]";
                case LogLevel::kError: return "[refreshlatch][error]";
            }
            return "[refreshlatch]";
        }

        std::string_view file_basename(std::string_view path) {
            const auto slash = path.find_last_of('/');
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }

    } // namespace

    std::string format_log_entry(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
        std::string entry(level_tag(level));
        entry.push_back(' ');
        if (!context.empty()) {
            entry.append(context);
            entry.append(": ");
        }
        entry.append(message);
        entry.append(" @");
        entry.append(file_basename(location.file_name()));
        entry.push_back(':');
        entry.append(std::to_string(location.line()));
        if (const std::string_view function = location.function_name(); !function.empty()) {
            entry.push_back(' ');
            entry.append(function);
        }
        return entry;
    }

    void set_debug_log_sink(LogSink sink) {
        debug_sink = sink;
    }

    void clear_debug_log_sink() {
        debug_sink = nullptr;
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (enabled && debug_sink) {
            debug_sink(format_log_entry(LogLevel::kDebug, context, message, location));
        }
    }

    void set_error_log_sink(LogSink sink) {
        error_sink = sink;
    }

    void clear_error_log_sink() {
        error_sink = nullptr;
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        if (error_sink) {
            error_sink(format_log_entry(LogLevel::kError, context, message, location));
        }
    }

} // namespace refreshlatch
