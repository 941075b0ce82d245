#ifndef REFRESHLATCH_ERRORS_HPP
#define REFRESHLATCH_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string_view>

namespace refreshlatch {

    class InvalidConfigurationError : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    class UseAfterDisposeError : public std::logic_error {
      public:
        using std::logic_error::logic_error;
    };

    // Throws InvalidConfigurationError when `value` is negative or exceeds kMaxDelay.
    void require_delay(std::chrono::milliseconds value, std::string_view field);

} // namespace refreshlatch

#endif // REFRESHLATCH_ERRORS_HPP
