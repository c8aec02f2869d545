#include "event-stream-decoder.h"
#include "../common/crew-common.h"

#include <spdlog/spdlog.h>

namespace crew {

std::string describe_event(const progress_event& event) {
    if (const auto* text = std::get_if<text_fragment>(&event)) {
        return "text(" + text->text + ")";
    }
    if (const auto* tool = std::get_if<tool_start>(&event)) {
        return "tool_start(" + tool->name + ")";
    }
    const auto& done = std::get<run_completed>(event);
    return "completed(" + std::to_string(done.exit_status) + ")";
}

namespace {

std::optional<std::string> string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

int int_field(const json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int>();
}

} // namespace

event_stream_decoder::event_stream_decoder(progress_callback on_event)
    : on_event_(std::move(on_event)) {
}

std::optional<progress_event> event_stream_decoder::parse_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
        return std::nullopt;
    }

    json record = json::parse(line.begin(), line.end(), nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return std::nullopt;
    }

    auto type = string_field(record, "type");
    if (!type) {
        return std::nullopt;
    }

    if (*type == "text") {
        auto delta = string_field(record, "delta");
        if (!delta) return std::nullopt;
        return progress_event{text_fragment{*delta}};
    }
    if (*type == "tool_start") {
        auto name = string_field(record, "name");
        if (!name) return std::nullopt;
        return progress_event{tool_start{*name}};
    }
    if (*type == "end") {
        return progress_event{run_completed{int_field(record, "exit_status", 0)}};
    }

    // Native json mode of the agent CLI
    if (*type == "message_update") {
        auto it = record.find("assistantMessageEvent");
        if (it == record.end() || !it->is_object()) return std::nullopt;
        if (string_field(*it, "type").value_or("") != "text_delta") return std::nullopt;
        auto delta = string_field(*it, "delta");
        if (!delta) return std::nullopt;
        return progress_event{text_fragment{*delta}};
    }
    if (*type == "tool_execution_start") {
        auto name = string_field(record, "toolName");
        if (!name) return std::nullopt;
        return progress_event{tool_start{*name}};
    }
    if (*type == "agent_end") {
        return progress_event{run_completed{0}};
    }

    return std::nullopt;
}

void event_stream_decoder::process_line(std::string_view line) {
    auto event = parse_line(line);
    if (!event) {
        std::string_view trimmed = line;
        if (!trimmed.empty() && trimmed.back() == '\r') trimmed.remove_suffix(1);
        if (trimmed.find_first_not_of(" \t") != std::string_view::npos) {
            discarded_++;
            spdlog::trace("discarding stream line: {}", truncate_utf8(std::string(trimmed), 120));
        }
        return;
    }
    if (on_event_) {
        on_event_(*event);
    }
}

void event_stream_decoder::feed(std::string_view chunk) {
    if (finished_ || chunk.empty()) {
        return;
    }

    buffer_.append(chunk.data(), chunk.size());

    // Work on a local copy: a callback may finish() the decoder mid-chunk
    std::string pending;
    pending.swap(buffer_);

    // Every complete line is processed; the tail stays buffered
    size_t start = 0;
    size_t newline;
    while (!finished_ && (newline = pending.find('\n', start)) != std::string::npos) {
        process_line(std::string_view(pending).substr(start, newline - start));
        start = newline + 1;
    }
    if (!finished_) {
        buffer_ = pending.substr(start);
    }
}

void event_stream_decoder::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;

    std::string remainder;
    remainder.swap(buffer_);
    if (!remainder.empty()) {
        process_line(remainder);
    }
}

} // namespace crew
