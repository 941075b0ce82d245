#ifndef REFRESHLATCH_MANUAL_SCHEDULER_HPP
#define REFRESHLATCH_MANUAL_SCHEDULER_HPP

#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "refreshlatch/scheduler.hpp"

namespace refreshlatch {

    // Virtual-time scheduler for hosts that tick the latch themselves.
    // Time only moves through advance()/advance_to(); due callbacks run in
    // deadline order, ties in scheduling order, with now() reporting the
    // callback's deadline while it runs.
    class ManualScheduler final : public Scheduler {
      public:
        explicit ManualScheduler(Clock::time_point start = Clock::time_point{});

        TaskHandle                       schedule(std::chrono::milliseconds delay, Callback callback) override;
        bool                             cancel(TaskHandle handle) override;
        void                             cancel_all() override;
        std::size_t                      pending() const override;
        Clock::time_point                now() const override;

        std::size_t                      advance(std::chrono::milliseconds step);
        std::size_t                      advance_to(Clock::time_point target);
        std::size_t                      run_pending();
        std::optional<Clock::time_point> next_deadline() const;

      private:
        using TaskKey = std::pair<Clock::time_point, std::uint64_t>;

        // Saturates at time_point::max() instead of overflowing.
        Clock::time_point                           deadline_after(std::chrono::milliseconds delay) const;

        std::map<TaskKey, Callback>                 tasks_;
        std::unordered_map<std::uint64_t, TaskKey>  keys_;
        Clock::time_point                           now_;
        std::uint64_t                               next_id_ = 1;
    };

} // namespace refreshlatch

#endif // REFRESHLATCH_MANUAL_SCHEDULER_HPP
