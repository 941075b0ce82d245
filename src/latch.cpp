#include "refreshlatch/latch.hpp"

#include <string>
#include <utility>

#include "refreshlatch/errors.hpp"
#include "refreshlatch/logging.hpp"

namespace refreshlatch {

    namespace {

        constexpr std::string_view kLogContext = "refresh latch";

        std::chrono::milliseconds  checked_duration(std::chrono::milliseconds value, std::string_view field) {
            require_delay(value, field);
            return value;
        }

        LatchSink checked_sink(LatchSink sink) {
            if (!sink) {
                throw InvalidConfigurationError("sink is required");
            }
            return sink;
        }

        std::string describe_delay(std::string_view command, std::chrono::milliseconds delay) {
            std::string text(command);
            text.append(" scheduled delay=");
            text.append(std::to_string(delay.count()));
            text.append("ms");
            return text;
        }

    } // namespace

    std::string_view latch_phase_name(LatchPhase phase) {
        switch (phase) {
            case LatchPhase::kIdle: return "idle";
            case LatchPhase::kPendingShow: return "pending_show";
            case LatchPhase::kShown: return "shown";
            case LatchPhase::kPendingHide: return "pending_hide";
        }
        return "unknown";
    }

    RefreshLatch::RefreshLatch(Scheduler& scheduler, LatchConfig config) :
        scheduler_(scheduler), delay_time_(checked_duration(config.delay_time, "delay_time")), min_show_time_(checked_duration(config.min_show_time, "min_show_time")),
        sink_(checked_sink(std::move(config.sink))) {}

    RefreshLatch::~RefreshLatch() {
        if (!disposed_) {
            clear_commands();
            disposed_ = true;
        }
    }

    void RefreshLatch::set_busy(bool busy) {
        require_live("set_busy");
        if (state_.busy == busy) {
            trace("no-op ignored");
            return;
        }

        clear_commands();
        state_.busy = busy;

        if (busy) {
            queue_show();
        } else if (state_.time_shown) {
            queue_hide(*state_.time_shown);
        } else {
            // Show never fired, so the pending show is the only thing to undo.
            trace("no show to hide");
        }
    }

    void RefreshLatch::force(bool busy) {
        require_live("force");
        clear_commands();
        state_.busy = busy;
        trace(busy ? "forced show" : "forced hide");
        if (busy) {
            show();
        } else {
            hide();
        }
    }

    void RefreshLatch::dispose() {
        require_live("dispose");
        clear_commands();
        disposed_ = true;
        trace("disposed");
    }

    RefreshLatch& RefreshLatch::enable_debugging() {
        require_live("enable_debugging");
        debug_ = true;
        trace("debugging enabled");
        return *this;
    }

    bool RefreshLatch::busy() const {
        return state_.busy;
    }

    bool RefreshLatch::shown() const {
        return state_.time_shown.has_value();
    }

    bool RefreshLatch::disposed() const {
        return disposed_;
    }

    LatchPhase RefreshLatch::phase() const {
        if (pending_) {
            return pending_->show ? LatchPhase::kPendingShow : LatchPhase::kPendingHide;
        }
        return state_.time_shown ? LatchPhase::kShown : LatchPhase::kIdle;
    }

    std::chrono::milliseconds RefreshLatch::delay_time() const {
        return delay_time_;
    }

    std::chrono::milliseconds RefreshLatch::min_show_time() const {
        return min_show_time_;
    }

    void RefreshLatch::queue_show() {
        trace(describe_delay("show", delay_time_));
        queue_command(delay_time_, true);
    }

    void RefreshLatch::queue_hide(Scheduler::Clock::time_point time_shown) {
        const auto shown_for = std::chrono::duration_cast<std::chrono::milliseconds>(scheduler_.now() - time_shown);
        if (shown_for < min_show_time_) {
            const auto delay = min_show_time_ - shown_for;
            trace(describe_delay("hide", delay));
            queue_command(delay, false);
            return;
        }
        hide();
    }

    void RefreshLatch::queue_command(std::chrono::milliseconds delay, bool show) {
        const auto handle = scheduler_.schedule(delay, [this, show]() {
            pending_.reset();
            if (show) {
                this->show();
            } else {
                this->hide();
            }
        });
        pending_ = PendingCommand{.handle = handle, .show = show};
    }

    void RefreshLatch::clear_commands() {
        if (!pending_) {
            return;
        }
        trace("commands cleared");
        scheduler_.cancel(pending_->handle);
        pending_.reset();
    }

    void RefreshLatch::show() {
        trace("show fired");
        state_.time_shown = scheduler_.now();
        sink_(true);
    }

    void RefreshLatch::hide() {
        trace("hide fired");
        state_.time_shown.reset();
        sink_(false);
    }

    void RefreshLatch::require_live(std::string_view operation) const {
        if (!disposed_) {
            return;
        }
        std::string message(operation);
        message.append("() called on a disposed refresh latch");
        throw UseAfterDisposeError(message);
    }

    void RefreshLatch::trace(std::string_view message) const {
        debug_log(debug_, kLogContext, message);
    }

} // namespace refreshlatch
