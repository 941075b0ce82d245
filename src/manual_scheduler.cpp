#include "refreshlatch/manual_scheduler.hpp"

#include "refreshlatch/errors.hpp"

namespace refreshlatch {

    ManualScheduler::ManualScheduler(Clock::time_point start) : now_(start) {}

    TaskHandle ManualScheduler::schedule(std::chrono::milliseconds delay, Callback callback) {
        require_delay(delay, "delay");
        const TaskHandle handle{next_id_++};
        const TaskKey    key{deadline_after(delay), handle.id};
        tasks_.emplace(key, std::move(callback));
        keys_.emplace(handle.id, key);
        return handle;
    }

    bool ManualScheduler::cancel(TaskHandle handle) {
        const auto it = keys_.find(handle.id);
        if (it == keys_.end()) {
            return false;
        }
        tasks_.erase(it->second);
        keys_.erase(it);
        return true;
    }

    void ManualScheduler::cancel_all() {
        tasks_.clear();
        keys_.clear();
    }

    std::size_t ManualScheduler::pending() const {
        return tasks_.size();
    }

    Scheduler::Clock::time_point ManualScheduler::now() const {
        return now_;
    }

    std::size_t ManualScheduler::advance(std::chrono::milliseconds step) {
        require_delay(step, "step");
        return advance_to(deadline_after(step));
    }

    std::size_t ManualScheduler::advance_to(Clock::time_point target) {
        std::size_t fired = 0;
        while (!tasks_.empty()) {
            auto it = tasks_.begin();
            if (it->first.first > target) {
                break;
            }
            if (it->first.first > now_) {
                now_ = it->first.first;
            }
            auto callback = std::move(it->second);
            keys_.erase(it->first.second);
            tasks_.erase(it);
            ++fired;
            callback();
        }
        if (target > now_) {
            now_ = target;
        }
        return fired;
    }

    std::size_t ManualScheduler::run_pending() {
        return advance_to(now_);
    }

    Scheduler::Clock::time_point ManualScheduler::deadline_after(std::chrono::milliseconds delay) const {
        const auto headroom = Clock::time_point::max() - now_;
        if (delay >= headroom) {
            return Clock::time_point::max();
        }
        return now_ + delay;
    }

    std::optional<Scheduler::Clock::time_point> ManualScheduler::next_deadline() const {
        if (tasks_.empty()) {
            return std::nullopt;
        }
        return tasks_.begin()->first.first;
    }

} // namespace refreshlatch
