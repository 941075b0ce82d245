#include "refreshlatch/settings.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace refreshlatch {

    namespace {

        constexpr std::string_view kDelayKey   = "delay_ms";
        constexpr std::string_view kMinShowKey = "min_show_ms";
        constexpr std::string_view kDebugKey   = "debug_logging";

        SettingsError              settings_error(std::string_view context, std::string message) {
            return SettingsError{.context = std::string(context), .message = std::move(message)};
        }

        SettingsResult<std::optional<std::chrono::milliseconds>> duration_field(const nlohmann::json& root, std::string_view key) {
            const auto it = root.find(std::string(key));
            if (it == root.end() || it->is_null()) {
                return std::nullopt;
            }
            if (!it->is_number_integer()) {
                return std::unexpected(settings_error(key, "expected integer milliseconds"));
            }
            if (it->is_number_unsigned() && it->get<std::uint64_t>() > static_cast<std::uint64_t>(kMaxDelay.count())) {
                return std::unexpected(settings_error(key, "exceeds the clock range"));
            }
            const auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(settings_error(key, "must not be negative"));
            }
            if (value > kMaxDelay.count()) {
                return std::unexpected(settings_error(key, "exceeds the clock range"));
            }
            return std::chrono::milliseconds(value);
        }

        SettingsResult<std::optional<bool>> bool_field(const nlohmann::json& root, std::string_view key) {
            const auto it = root.find(std::string(key));
            if (it == root.end() || it->is_null()) {
                return std::nullopt;
            }
            if (!it->is_boolean()) {
                return std::unexpected(settings_error(key, "expected boolean"));
            }
            return it->get<bool>();
        }

        std::optional<std::string> read_text_file(const std::filesystem::path& path) {
            std::ifstream input(path);
            if (!input.good()) {
                return std::nullopt;
            }
            std::ostringstream buffer;
            buffer << input.rdbuf();
            return buffer.str();
        }

    } // namespace

    LatchSettings apply_overrides(const LatchSettings& base, const LatchSettingsOverrides& overrides) {
        LatchSettings merged = base;
        if (overrides.delay_time) {
            merged.delay_time = *overrides.delay_time;
        }
        if (overrides.min_show_time) {
            merged.min_show_time = *overrides.min_show_time;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    SettingsResult<LatchSettingsOverrides> parse_latch_settings(std::string_view json_text) {
        const auto root = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
        if (root.is_discarded()) {
            return std::unexpected(settings_error("settings", "invalid json"));
        }
        if (!root.is_object()) {
            return std::unexpected(settings_error("settings", "not an object"));
        }

        const auto delay = duration_field(root, kDelayKey);
        if (!delay) {
            return std::unexpected(delay.error());
        }
        const auto min_show = duration_field(root, kMinShowKey);
        if (!min_show) {
            return std::unexpected(min_show.error());
        }
        const auto debug = bool_field(root, kDebugKey);
        if (!debug) {
            return std::unexpected(debug.error());
        }

        return LatchSettingsOverrides{
            .delay_time    = *delay,
            .min_show_time = *min_show,
            .debug_logging = *debug,
        };
    }

    SettingsResult<LatchSettings> load_latch_settings(const std::filesystem::path& path, const LatchSettings& base) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                return std::unexpected(settings_error(path.string(), ec.message()));
            }
            return base;
        }
        const auto contents = read_text_file(path);
        if (!contents) {
            return std::unexpected(settings_error(path.string(), "unable to read settings"));
        }
        auto overrides = parse_latch_settings(*contents);
        if (!overrides) {
            auto error    = overrides.error();
            error.context = path.string() + ": " + error.context;
            return std::unexpected(std::move(error));
        }
        return apply_overrides(base, *overrides);
    }

    LatchConfig latch_config_from_settings(const LatchSettings& settings, LatchSink sink) {
        return LatchConfig{
            .delay_time    = settings.delay_time,
            .min_show_time = settings.min_show_time,
            .sink          = std::move(sink),
        };
    }

} // namespace refreshlatch
