#ifndef REFRESHLATCH_LATCH_HPP
#define REFRESHLATCH_LATCH_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

#include "refreshlatch/scheduler.hpp"

namespace refreshlatch {

    inline constexpr std::chrono::milliseconds kDefaultDelayTime{300};
    inline constexpr std::chrono::milliseconds kDefaultMinShowTime{700};

    // Receives true to show the refresh indicator and false to hide it.
    using LatchSink = std::function<void(bool show)>;

    struct LatchConfig {
        std::chrono::milliseconds delay_time    = kDefaultDelayTime;
        std::chrono::milliseconds min_show_time = kDefaultMinShowTime;
        LatchSink                 sink;
    };

    enum class LatchPhase {
        kIdle,
        kPendingShow,
        kShown,
        kPendingHide,
    };

    std::string_view latch_phase_name(LatchPhase phase);

    /**
     * Smooths a busy signal so a refresh indicator never flickers.
     *
     * A refresh that ends within delay_time is never shown. Once shown, the
     * indicator stays up for at least min_show_time, measured from the moment
     * show was emitted, or for as long as the refresh runs, whichever is longer.
     *
     * All calls and all scheduled emissions must happen on the scheduler's
     * execution context, and the scheduler must outlive the latch. At most one
     * emission is pending at a time.
     */
    class RefreshLatch {
      public:
        // Throws InvalidConfigurationError for negative durations or an empty sink.
        RefreshLatch(Scheduler& scheduler, LatchConfig config);
        ~RefreshLatch();

        RefreshLatch(const RefreshLatch&)            = delete;
        RefreshLatch& operator=(const RefreshLatch&) = delete;

        // Repeating the current value is a no-op. Otherwise the pending emission
        // is cancelled and show/hide is queued according to the timing rules.
        void                      set_busy(bool busy);

        // Cancels anything pending and emits show or hide right away.
        void                      force(bool busy);

        // Cancels the pending emission. Every mutating call afterwards throws
        // UseAfterDisposeError.
        void                      dispose();

        RefreshLatch&             enable_debugging();

        bool                      busy() const;
        bool                      shown() const;
        bool                      disposed() const;
        LatchPhase                phase() const;
        std::chrono::milliseconds delay_time() const;
        std::chrono::milliseconds min_show_time() const;

      private:
        struct LatchState {
            bool                                        busy = false;
            std::optional<Scheduler::Clock::time_point> time_shown;
        };

        struct PendingCommand {
            TaskHandle handle;
            bool       show = false;
        };

        void                            queue_show();
        void                            queue_hide(Scheduler::Clock::time_point time_shown);
        void                            queue_command(std::chrono::milliseconds delay, bool show);
        void                            clear_commands();
        void                            show();
        void                            hide();
        void                            require_live(std::string_view operation) const;
        void                            trace(std::string_view message) const;

        Scheduler&                      scheduler_;
        const std::chrono::milliseconds delay_time_;
        const std::chrono::milliseconds min_show_time_;
        LatchSink                       sink_;
        LatchState                      state_;
        std::optional<PendingCommand>   pending_;
        bool                            debug_    = false;
        bool                            disposed_ = false;
    };

} // namespace refreshlatch

#endif // REFRESHLATCH_LATCH_HPP
