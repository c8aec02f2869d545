#pragma once

#include "progress-event.h"

#include <optional>
#include <string>
#include <string_view>

namespace crew {

/**
 * Reassembles newline-delimited JSON records from arbitrary-sized chunks of
 * one child's stdout and emits them as progress events.
 *
 * Contract:
 * - Events are emitted in the order their lines appeared; the emitted
 *   sequence does not depend on how the stream was split into chunks.
 * - Lines that are not a recognized record are dropped (counted, never
 *   fatal): the stream may interleave plain diagnostic text.
 * - finish() gives the buffered remainder one last parse attempt; after
 *   that, feed() and finish() are no-ops.
 */
class event_stream_decoder {
public:
    explicit event_stream_decoder(progress_callback on_event = nullptr);

    void set_callback(progress_callback on_event) { on_event_ = std::move(on_event); }

    void feed(std::string_view chunk);
    void finish();

    bool is_finished() const { return finished_; }
    size_t discarded_lines() const { return discarded_; }
    size_t pending_bytes() const { return buffer_.size(); }

    // Parse one complete line (without the newline).
    // Returns nullopt for noise, blank lines and unknown record types.
    static std::optional<progress_event> parse_line(std::string_view line);

private:
    void process_line(std::string_view line);

    std::string buffer_;            // pending partial line
    progress_callback on_event_;
    bool finished_ = false;
    size_t discarded_ = 0;
};

} // namespace crew
