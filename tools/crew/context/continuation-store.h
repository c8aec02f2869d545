#pragma once

#include "../common/crew-common.h"

#include <optional>
#include <string>
#include <vector>

namespace crew {

// Index entry for one continuation channel
struct channel_summary {
    std::string channel;
    std::string role;
    std::string created_at;
    std::string updated_at;
    int dispatch_count = 0;
    bool has_record = false;
};

/**
 * Persistent conversation records that let a role's next dispatch recall
 * earlier work.
 *
 * The child agent owns the record file itself (<base>/sessions/<channel>.jsonl);
 * this store only decides where it lives, whether it exists, and keeps a
 * small index (<base>/sessions/index.json) of which role used which channel.
 */
class continuation_store {
public:
    explicit continuation_store(const std::string& base_path);

    // Path of the record file for a channel
    std::string record_path(const std::string& channel) const;

    // True when a prior record exists (file present and non-empty)
    bool has_record(const std::string& channel) const;

    // Note a dispatch on this channel in the index
    bool touch(const std::string& channel, const std::string& role);

    // All indexed channels, most recently used first
    std::vector<channel_summary> list() const;

    // Delete a channel's record and index entry
    bool remove(const std::string& channel);

    const std::string& base_path() const { return base_path_; }

    // Map a channel name to a filesystem-safe file stem
    static std::string sanitize_channel(const std::string& channel);

private:
    std::string base_path_;
    std::string sessions_dir_;

    std::string index_path() const;

    // Get current ISO8601 timestamp
    static std::string iso8601_now();

    // Ensure directory exists
    static bool ensure_directory(const std::string& path);

    // Read JSON from file
    static std::optional<json> read_json(const std::string& path);

    // Write JSON to file atomically
    static bool write_json(const std::string& path, const json& data);
};

} // namespace crew
