#include "refreshlatch/errors.hpp"

#include <string>

#include "refreshlatch/scheduler.hpp"

namespace refreshlatch {

    namespace {

        void require_non_negative(std::chrono::milliseconds value, std::string_view field) {
            if (value.count() >= 0) {
                return;
            }
            std::string message(field);
            message.append(" must not be negative (got ");
            message.append(std::to_string(value.count()));
            message.append("ms)");
            throw InvalidConfigurationError(message);
        }

    } // namespace

    void require_delay(std::chrono::milliseconds value, std::string_view field) {
        require_non_negative(value, field);
        if (value <= kMaxDelay) {
            return;
        }
        std::string message(field);
        message.append(" exceeds the clock range (got ");
        message.append(std::to_string(value.count()));
        message.append("ms, max ");
        message.append(std::to_string(kMaxDelay.count()));
        message.append("ms)");
        throw InvalidConfigurationError(message);
    }

} // namespace refreshlatch
