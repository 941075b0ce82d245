#ifndef REFRESHLATCH_SCHEDULER_HPP
#define REFRESHLATCH_SCHEDULER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace refreshlatch {

    struct TaskHandle {
        std::uint64_t id = 0;

        bool          valid() const {
            return id != 0;
        }

        bool operator==(const TaskHandle&) const = default;
    };

    // Runs delayed callbacks on one execution context. Implementations are not
    // thread-safe; every call, and every callback, happens on the owning context.
    class Scheduler {
      public:
        using Clock    = std::chrono::steady_clock;
        using Callback = std::function<void()>;

        virtual ~Scheduler() = default;

        // Fires `callback` once, no earlier than `delay` from now and never from
        // inside schedule() itself. Throws InvalidConfigurationError for a
        // negative delay or one above kMaxDelay.
        virtual TaskHandle        schedule(std::chrono::milliseconds delay, Callback callback) = 0;
        virtual bool              cancel(TaskHandle handle)                                    = 0;
        virtual void              cancel_all()                                                 = 0;
        virtual std::size_t       pending() const                                              = 0;
        virtual Clock::time_point now() const                                                  = 0;
    };

    // Longest delay whose deadline is representable on Scheduler::Clock.
    inline constexpr std::chrono::milliseconds kMaxDelay = std::chrono::duration_cast<std::chrono::milliseconds>(Scheduler::Clock::duration::max());

} // namespace refreshlatch

#endif // REFRESHLATCH_SCHEDULER_HPP
