#include "refreshlatch/latches.hpp"

#include <utility>

namespace refreshlatch {

    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, LatchSink sink) {
        return make_refresh_latch(scheduler, kDefaultDelayTime, kDefaultMinShowTime, std::move(sink));
    }

    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, std::chrono::milliseconds delay_time, std::chrono::milliseconds min_show_time, LatchSink sink) {
        return std::make_unique<RefreshLatch>(scheduler, LatchConfig{.delay_time = delay_time, .min_show_time = min_show_time, .sink = std::move(sink)});
    }

    std::unique_ptr<RefreshLatch> make_refresh_latch_with_delay(Scheduler& scheduler, std::chrono::milliseconds delay_time, LatchSink sink) {
        return make_refresh_latch(scheduler, delay_time, kDefaultMinShowTime, std::move(sink));
    }

    std::unique_ptr<RefreshLatch> make_refresh_latch_with_min_show_time(Scheduler& scheduler, std::chrono::milliseconds min_show_time, LatchSink sink) {
        return make_refresh_latch(scheduler, kDefaultDelayTime, min_show_time, std::move(sink));
    }

    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, const LatchSettings& settings, LatchSink sink) {
        auto latch = std::make_unique<RefreshLatch>(scheduler, latch_config_from_settings(settings, std::move(sink)));
        if (settings.debug_logging) {
            latch->enable_debugging();
        }
        return latch;
    }

} // namespace refreshlatch
