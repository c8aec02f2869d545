#include "unit-tracker.h"
#include "../common/crew-common.h"

#include <algorithm>

namespace crew {

const char* unit_status_to_string(unit_status status) {
    switch (status) {
        case unit_status::IDLE:    return "idle";
        case unit_status::RUNNING: return "running";
        case unit_status::DONE:    return "done";
        case unit_status::FAILED:  return "error";
        default:                   return "unknown";
    }
}

namespace {

// Last non-empty line of a text block
std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return trim(text.substr(start, end - start + 1));
}

} // namespace

unit_of_work* unit_tracker::find(const std::string& id) {
    for (auto& unit : units_) {
        if (unit.id == id) {
            return &unit;
        }
    }
    return nullptr;
}

const unit_of_work* unit_tracker::find(const std::string& id) const {
    for (const auto& unit : units_) {
        if (unit.id == id) {
            return &unit;
        }
    }
    return nullptr;
}

bool unit_tracker::add_unit(const std::string& id, const std::string& label) {
    if (find(id) != nullptr) {
        return false;
    }
    unit_of_work unit;
    unit.id = id;
    unit.label = label;
    units_.push_back(std::move(unit));
    return true;
}

bool unit_tracker::is_running(const std::string& id) const {
    const auto* unit = find(id);
    return unit != nullptr && unit->status == unit_status::RUNNING;
}

bool unit_tracker::any_running() const {
    return std::any_of(units_.begin(), units_.end(), [](const unit_of_work& unit) {
        return unit.status == unit_status::RUNNING;
    });
}

bool unit_tracker::begin(const std::string& id, clock::time_point now) {
    auto* unit = find(id);
    if (unit == nullptr || unit->status == unit_status::RUNNING) {
        return false;
    }
    unit->status = unit_status::RUNNING;
    unit->started_at = now;
    unit->elapsed_ms = 0;
    unit->last_activity.clear();
    unit->accumulated_text.clear();
    unit->tool_calls = 0;
    return true;
}

void unit_tracker::apply_event(const std::string& id, const progress_event& event) {
    auto* unit = find(id);
    if (unit == nullptr || unit->status != unit_status::RUNNING) {
        return;
    }

    if (const auto* text = std::get_if<text_fragment>(&event)) {
        unit->accumulated_text += text->text;
        // Whitespace-only fragments keep the current activity (e.g. a tool start)
        if (!trim(text->text).empty()) {
            unit->last_activity = last_line(unit->accumulated_text);
        }
    } else if (const auto* tool = std::get_if<tool_start>(&event)) {
        unit->tool_calls++;
        unit->last_activity = "→ " + tool->name;
    }
    // run_completed carries no display state; the exit decides the outcome
}

void unit_tracker::finish(const std::string& id, bool success, clock::time_point now) {
    auto* unit = find(id);
    if (unit == nullptr || unit->status != unit_status::RUNNING) {
        return;
    }
    update_elapsed(*unit, now);
    unit->status = success ? unit_status::DONE : unit_status::FAILED;
}

void unit_tracker::reset(const std::string& id) {
    auto* unit = find(id);
    if (unit == nullptr) {
        return;
    }
    unit_of_work fresh;
    fresh.id = unit->id;
    fresh.label = unit->label;
    *unit = std::move(fresh);
}

void unit_tracker::reset_all() {
    for (auto& unit : units_) {
        reset(unit.id);
    }
}

void unit_tracker::tick(clock::time_point now) {
    for (auto& unit : units_) {
        if (unit.status == unit_status::RUNNING) {
            update_elapsed(unit, now);
        }
    }
}

void unit_tracker::update_elapsed(unit_of_work& unit, clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - unit.started_at).count();
    // Never moves backwards, even if ticks arrive with stale timestamps
    unit.elapsed_ms = std::max<int64_t>(unit.elapsed_ms, elapsed);
}

} // namespace crew
