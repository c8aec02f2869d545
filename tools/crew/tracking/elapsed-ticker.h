#pragma once

#include "unit-tracker.h"
#include "../process/event-loop.h"

#include <functional>

namespace crew {

// Periodic scheduler that recomputes elapsed time of running units and
// triggers a redraw. The timer only exists while some unit is RUNNING, so an
// idle strategy leaves the loop free to drain.
class elapsed_ticker {
public:
    elapsed_ticker(event_loop& loop, unit_tracker& tracker, int interval_ms);
    ~elapsed_ticker();

    elapsed_ticker(const elapsed_ticker&) = delete;
    elapsed_ticker& operator=(const elapsed_ticker&) = delete;

    void set_callback(std::function<void()> on_tick) { on_tick_ = std::move(on_tick); }

    // Start if not already running
    void start();
    // Stop once no unit is RUNNING
    void stop_if_idle();

    bool is_active() const { return timer_ != 0; }

private:
    void tick();

    event_loop& loop_;
    unit_tracker& tracker_;
    int interval_ms_;
    event_loop::timer_id timer_ = 0;
    std::function<void()> on_tick_;
};

} // namespace crew
