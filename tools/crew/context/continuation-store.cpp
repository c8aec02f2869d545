#include "continuation-store.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

namespace crew {

continuation_store::continuation_store(const std::string& base_path)
    : base_path_(base_path)
    , sessions_dir_(base_path + "/sessions") {
    if (!ensure_directory(sessions_dir_)) {
        spdlog::warn("cannot create continuation directory {}", sessions_dir_);
    }
}

std::string continuation_store::sanitize_channel(const std::string& channel) {
    std::string result;
    result.reserve(channel.size());
    for (char c : channel) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            result += c;
        } else {
            result += '_';
        }
    }
    // No hidden files or path tricks
    while (!result.empty() && result.front() == '.') {
        result.front() = '_';
    }
    if (result.empty()) {
        result = "_";
    }
    return result;
}

std::string continuation_store::record_path(const std::string& channel) const {
    return sessions_dir_ + "/" + sanitize_channel(channel) + ".jsonl";
}

std::string continuation_store::index_path() const {
    return sessions_dir_ + "/index.json";
}

bool continuation_store::has_record(const std::string& channel) const {
    std::error_code ec;
    auto size = fs::file_size(record_path(channel), ec);
    return !ec && size > 0;
}

bool continuation_store::touch(const std::string& channel, const std::string& role) {
    json index = read_json(index_path()).value_or(json::object());
    if (!index.is_object()) {
        index = json::object();
    }

    const std::string key = sanitize_channel(channel);
    const std::string now = iso8601_now();

    json entry = index.value(key, json::object());
    if (!entry.is_object()) {
        entry = json::object();
    }
    if (!entry.contains("created_at")) {
        entry["created_at"] = now;
    }
    entry["role"] = role;
    entry["updated_at"] = now;
    int count = entry.contains("dispatch_count") && entry["dispatch_count"].is_number_integer()
        ? entry["dispatch_count"].get<int>() : 0;
    entry["dispatch_count"] = count + 1;
    index[key] = entry;

    return write_json(index_path(), index);
}

std::vector<channel_summary> continuation_store::list() const {
    std::vector<channel_summary> result;

    auto index = read_json(index_path());
    if (!index || !index->is_object()) {
        return result;
    }

    for (const auto& item : index->items()) {
        const json& entry = item.value();
        if (!entry.is_object()) {
            continue;
        }
        channel_summary summary;
        summary.channel = item.key();
        summary.role = entry.value("role", "");
        summary.created_at = entry.value("created_at", "");
        summary.updated_at = entry.value("updated_at", "");
        summary.dispatch_count = entry.value("dispatch_count", 0);
        summary.has_record = has_record(summary.channel);
        result.push_back(summary);
    }

    // Sort by updated_at descending
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) {
                  return a.updated_at > b.updated_at;
              });

    return result;
}

bool continuation_store::remove(const std::string& channel) {
    const std::string key = sanitize_channel(channel);
    std::error_code ec;
    bool removed = fs::remove(record_path(channel), ec);

    auto index = read_json(index_path());
    if (index && index->is_object() && index->contains(key)) {
        index->erase(key);
        removed = write_json(index_path(), *index) || removed;
    }
    return removed;
}

std::string continuation_store::iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t_now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

bool continuation_store::ensure_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::optional<json> continuation_store::read_json(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return std::nullopt;
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("ignoring malformed index file {}", path);
        return std::nullopt;
    }
    return j;
}

bool continuation_store::write_json(const std::string& path, const json& data) {
    // Write to temp file first, then rename for atomicity
    std::string temp_path = path + ".tmp";
    {
        std::ofstream f(temp_path);
        if (!f) {
            return false;
        }
        f << data.dump(2);
        if (!f) {
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

} // namespace crew
