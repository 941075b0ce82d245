#ifndef REFRESHLATCH_EVENT_LOOP_SCHEDULER_HPP
#define REFRESHLATCH_EVENT_LOOP_SCHEDULER_HPP

#include <memory>
#include <unordered_map>

#include "refreshlatch/failsafe.hpp"
#include "refreshlatch/scheduler.hpp"

struct wl_event_loop;
struct wl_event_source;

namespace refreshlatch {

    // Scheduler backed by a libwayland-server event loop. Each pending callback
    // owns one event source: a timer, or an idle source for zero delays.
    // Exceptions escaping a callback are handed to `on_error`, which acts as the
    // host's error boundary since they cannot unwind through wl_event_loop_dispatch.
    // Both arguments are required. `loop` must outlive the scheduler, whose
    // destructor removes the remaining sources from it.
    class EventLoopScheduler final : public Scheduler {
      public:
        EventLoopScheduler(wl_event_loop* loop, failsafe::ErrorHandler on_error);
        ~EventLoopScheduler() override;

        EventLoopScheduler(const EventLoopScheduler&)            = delete;
        EventLoopScheduler& operator=(const EventLoopScheduler&) = delete;

        TaskHandle          schedule(std::chrono::milliseconds delay, Callback callback) override;
        bool                cancel(TaskHandle handle) override;
        void                cancel_all() override;
        std::size_t         pending() const override;
        Clock::time_point   now() const override;

      private:
        struct Task {
            EventLoopScheduler* owner  = nullptr;
            std::uint64_t       id     = 0;
            wl_event_source*    source = nullptr;
            bool                idle   = false;
            Callback            callback;
        };

        static int                                               on_timer(void* data);
        static void                                              on_idle(void* data);
        void                                                     fire(Task& task);
        static void                                              remove_source(Task& task);

        wl_event_loop*                                           loop_;
        failsafe::ErrorHandler                                   on_error_;
        std::unordered_map<std::uint64_t, std::unique_ptr<Task>> tasks_;
        std::uint64_t                                            next_id_ = 1;
    };

} // namespace refreshlatch

#endif // REFRESHLATCH_EVENT_LOOP_SCHEDULER_HPP
