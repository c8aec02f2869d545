#include "elapsed-ticker.h"

namespace crew {

elapsed_ticker::elapsed_ticker(event_loop& loop, unit_tracker& tracker, int interval_ms)
    : loop_(loop)
    , tracker_(tracker)
    , interval_ms_(interval_ms > 0 ? interval_ms : 1) {
}

elapsed_ticker::~elapsed_ticker() {
    if (timer_ != 0) {
        loop_.cancel_timer(timer_);
    }
}

void elapsed_ticker::start() {
    if (timer_ != 0) {
        return;
    }
    timer_ = loop_.add_timer(interval_ms_, [this]() { tick(); }, true);
}

void elapsed_ticker::stop_if_idle() {
    if (timer_ == 0 || tracker_.any_running()) {
        return;
    }
    loop_.cancel_timer(timer_);
    timer_ = 0;
}

void elapsed_ticker::tick() {
    tracker_.tick();
    if (on_tick_) {
        on_tick_();
    }
    stop_if_idle();
}

} // namespace crew
