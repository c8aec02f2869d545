#pragma once

#include "../process/progress-event.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace crew {

// Unit-of-work states. IDLE -> RUNNING -> DONE | FAILED -> IDLE (reset only)
enum class unit_status {
    IDLE,
    RUNNING,
    DONE,
    FAILED,    // displayed as "error"
};

const char* unit_status_to_string(unit_status status);

// Tracked status for one role (dispatcher) or one step (pipeline)
struct unit_of_work {
    std::string id;
    std::string label;
    unit_status status = unit_status::IDLE;
    std::chrono::steady_clock::time_point started_at{};
    int64_t elapsed_ms = 0;
    std::string last_activity;      // latest text line or "→ <tool>"
    std::string accumulated_text;
    int tool_calls = 0;
};

/**
 * Owns the unit-of-work records of one strategy.
 *
 * Mutated only from event loop callbacks (decoder events, completions,
 * ticks) and read by the status projector on the same thread.
 */
class unit_tracker {
public:
    using clock = std::chrono::steady_clock;

    // Register a unit in IDLE. Returns false if the id already exists.
    bool add_unit(const std::string& id, const std::string& label);

    bool contains(const std::string& id) const { return find(id) != nullptr; }

    // Get unit by id (returns nullptr if not found)
    const unit_of_work* get(const std::string& id) const { return find(id); }

    // Registration order
    const std::vector<unit_of_work>& units() const { return units_; }

    bool is_running(const std::string& id) const;
    bool any_running() const;

    // IDLE/DONE/FAILED -> RUNNING. Returns false (and changes nothing) if the
    // unit is missing or already RUNNING.
    bool begin(const std::string& id, clock::time_point now = clock::now());

    // Fold a progress event into a RUNNING unit; ignored otherwise
    void apply_event(const std::string& id, const progress_event& event);

    // RUNNING -> DONE | FAILED. Ignored unless RUNNING.
    void finish(const std::string& id, bool success, clock::time_point now = clock::now());

    // Back to a fresh IDLE record
    void reset(const std::string& id);
    void reset_all();

    // Recompute elapsed time of every RUNNING unit from its start time
    void tick(clock::time_point now = clock::now());

private:
    unit_of_work* find(const std::string& id);
    const unit_of_work* find(const std::string& id) const;

    static void update_elapsed(unit_of_work& unit, clock::time_point now);

    std::vector<unit_of_work> units_;
};

} // namespace crew
