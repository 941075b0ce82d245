#ifndef REFRESHLATCH_SETTINGS_HPP
#define REFRESHLATCH_SETTINGS_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "refreshlatch/latch.hpp"

namespace refreshlatch {

    struct LatchSettings {
        std::chrono::milliseconds delay_time    = kDefaultDelayTime;
        std::chrono::milliseconds min_show_time = kDefaultMinShowTime;
        bool                      debug_logging = false;
    };

    struct LatchSettingsOverrides {
        std::optional<std::chrono::milliseconds> delay_time;
        std::optional<std::chrono::milliseconds> min_show_time;
        std::optional<bool>                      debug_logging;
    };

    struct SettingsError {
        std::string context;
        std::string message;
    };

    inline std::string format_settings_error(const SettingsError& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using SettingsResult = std::expected<T, SettingsError>;

    LatchSettings                          apply_overrides(const LatchSettings& base, const LatchSettingsOverrides& overrides);

    // Reads {"delay_ms": int, "min_show_ms": int, "debug_logging": bool}.
    // Every key is optional; unknown keys are ignored.
    SettingsResult<LatchSettingsOverrides> parse_latch_settings(std::string_view json_text);

    // A missing file yields `base` unchanged.
    SettingsResult<LatchSettings>          load_latch_settings(const std::filesystem::path& path, const LatchSettings& base = {});

    LatchConfig                            latch_config_from_settings(const LatchSettings& settings, LatchSink sink);

} // namespace refreshlatch

#endif // REFRESHLATCH_SETTINGS_HPP
