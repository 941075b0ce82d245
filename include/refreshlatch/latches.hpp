#ifndef REFRESHLATCH_LATCHES_HPP
#define REFRESHLATCH_LATCHES_HPP

#include <chrono>
#include <memory>

#include "refreshlatch/latch.hpp"
#include "refreshlatch/settings.hpp"

namespace refreshlatch {

    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, LatchSink sink);
    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, std::chrono::milliseconds delay_time, std::chrono::milliseconds min_show_time, LatchSink sink);
    std::unique_ptr<RefreshLatch> make_refresh_latch_with_delay(Scheduler& scheduler, std::chrono::milliseconds delay_time, LatchSink sink);
    std::unique_ptr<RefreshLatch> make_refresh_latch_with_min_show_time(Scheduler& scheduler, std::chrono::milliseconds min_show_time, LatchSink sink);

    // Enables debugging when settings.debug_logging is set.
    std::unique_ptr<RefreshLatch> make_refresh_latch(Scheduler& scheduler, const LatchSettings& settings, LatchSink sink);

} // namespace refreshlatch

#endif // REFRESHLATCH_LATCHES_HPP
