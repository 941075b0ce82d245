#include "refreshlatch/event_loop_scheduler.hpp"

#include <limits>
#include <stdexcept>

#include <wayland-server-core.h>

#include "refreshlatch/errors.hpp"

namespace refreshlatch {

    namespace {

        int timer_delay_ms(std::chrono::milliseconds delay) {
            constexpr auto kMax = std::chrono::milliseconds(std::numeric_limits<int>::max());
            if (delay > kMax) {
                return std::numeric_limits<int>::max();
            }
            return static_cast<int>(delay.count());
        }

    } // namespace

    EventLoopScheduler::EventLoopScheduler(wl_event_loop* loop, failsafe::ErrorHandler on_error) : loop_(loop), on_error_(std::move(on_error)) {
        if (!loop_) {
            throw InvalidConfigurationError("event loop is required");
        }
        if (!on_error_) {
            throw InvalidConfigurationError("error handler is required");
        }
    }

    EventLoopScheduler::~EventLoopScheduler() {
        cancel_all();
    }

    TaskHandle EventLoopScheduler::schedule(std::chrono::milliseconds delay, Callback callback) {
        require_delay(delay, "delay");
        auto task      = std::make_unique<Task>();
        task->owner    = this;
        task->id       = next_id_++;
        task->callback = std::move(callback);

        // A zero timeout disarms a wayland timer, so immediate work goes through
        // an idle source that runs on the next dispatch.
        if (delay.count() == 0) {
            task->idle   = true;
            task->source = wl_event_loop_add_idle(loop_, EventLoopScheduler::on_idle, task.get());
        } else {
            task->source = wl_event_loop_add_timer(loop_, EventLoopScheduler::on_timer, task.get());
            if (task->source && wl_event_source_timer_update(task->source, timer_delay_ms(delay)) < 0) {
                wl_event_source_remove(task->source);
                task->source = nullptr;
            }
        }
        if (!task->source) {
            throw std::runtime_error("unable to register event loop source");
        }

        const TaskHandle handle{task->id};
        tasks_.emplace(handle.id, std::move(task));
        return handle;
    }

    bool EventLoopScheduler::cancel(TaskHandle handle) {
        const auto it = tasks_.find(handle.id);
        if (it == tasks_.end()) {
            return false;
        }
        remove_source(*it->second);
        tasks_.erase(it);
        return true;
    }

    void EventLoopScheduler::cancel_all() {
        for (auto& [id, task] : tasks_) {
            remove_source(*task);
        }
        tasks_.clear();
    }

    std::size_t EventLoopScheduler::pending() const {
        return tasks_.size();
    }

    Scheduler::Clock::time_point EventLoopScheduler::now() const {
        return Clock::now();
    }

    int EventLoopScheduler::on_timer(void* data) {
        auto* task = static_cast<Task*>(data);
        if (!task || !task->owner) {
            return 0;
        }
        task->owner->fire(*task);
        return 0;
    }

    void EventLoopScheduler::on_idle(void* data) {
        auto* task = static_cast<Task*>(data);
        if (!task || !task->owner) {
            return;
        }
        // The loop removes idle sources itself once this returns.
        task->source = nullptr;
        task->owner->fire(*task);
    }

    void EventLoopScheduler::fire(Task& task) {
        const auto it = tasks_.find(task.id);
        if (it == tasks_.end()) {
            return;
        }
        auto owned = std::move(it->second);
        tasks_.erase(it);
        remove_source(*owned);
        auto callback = std::move(owned->callback);
        owned.reset();
        if (!callback) {
            return;
        }
        (void)failsafe::guard(callback, on_error_, "scheduled callback");
    }

    void EventLoopScheduler::remove_source(Task& task) {
        if (task.source) {
            wl_event_source_remove(task.source);
            task.source = nullptr;
        }
    }

} // namespace refreshlatch
