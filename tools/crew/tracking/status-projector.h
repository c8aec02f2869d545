#pragma once

#include "unit-tracker.h"
#include "../common/constants.h"

#include <cstdint>
#include <string>
#include <vector>

namespace crew {

enum class projection_layout {
    LIST,    // independent units (dispatcher)
    CHAIN,   // ordered steps joined by connectors (pipeline)
};

// Render-ready view of one unit
struct status_row {
    std::string label;
    std::string glyph;
    int64_t elapsed_seconds = 0;
    std::string preview;
    std::string connector;   // drawn before the row in CHAIN layout

    bool operator==(const status_row& other) const {
        return label == other.label && glyph == other.glyph &&
               elapsed_seconds == other.elapsed_seconds &&
               preview == other.preview && connector == other.connector;
    }
};

const char* status_glyph(unit_status status);

// Pure projection of tracker state: no I/O, no mutation, O(units)
std::vector<status_row> project_status(const std::vector<unit_of_work>& units,
                                       projection_layout layout,
                                       size_t preview_width = config::DEFAULT_PREVIEW_WIDTH);

} // namespace crew
