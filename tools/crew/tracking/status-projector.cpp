#include "status-projector.h"
#include "../common/crew-common.h"

namespace crew {

const char* status_glyph(unit_status status) {
    switch (status) {
        case unit_status::IDLE:    return "○";
        case unit_status::RUNNING: return "●";
        case unit_status::DONE:    return "✓";
        case unit_status::FAILED:  return "✗";
        default:                   return "?";
    }
}

std::vector<status_row> project_status(const std::vector<unit_of_work>& units,
                                       projection_layout layout,
                                       size_t preview_width) {
    std::vector<status_row> rows;
    rows.reserve(units.size());

    for (size_t i = 0; i < units.size(); i++) {
        const auto& unit = units[i];

        status_row row;
        row.label = unit.label.empty() ? unit.id : unit.label;
        row.glyph = status_glyph(unit.status);
        row.elapsed_seconds = unit.elapsed_ms / 1000;
        row.preview = truncate_utf8(unit.last_activity, preview_width);
        if (layout == projection_layout::CHAIN && i > 0) {
            row.connector = "→";
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace crew
