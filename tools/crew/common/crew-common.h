#pragma once

// Common utilities and type aliases for the crew module.

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace crew {

namespace fs = std::filesystem;

using json = nlohmann::ordered_json;

// XML escaping for safe embedding in prompt sections.
// Handles: & < > " '
inline std::string escape_xml(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&':  result += "&amp;";  break;
            case '<':  result += "&lt;";   break;
            case '>':  result += "&gt;";   break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default:   result += c;        break;
        }
    }
    return result;
}

// Format error messages consistently.
// Pattern: "<action> failed: <reason> (<context>)"
inline std::string format_error(const std::string& action,
                                const std::string& reason,
                                const std::string& context = "") {
    std::string msg = action + " failed: " + reason;
    if (!context.empty()) {
        msg += " (" + context + ")";
    }
    return msg;
}

// Trim whitespace from both ends of a string
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Truncate to at most max_bytes, never splitting a UTF-8 sequence.
// Appends "..." when truncated (the ellipsis counts toward max_bytes).
inline std::string truncate_utf8(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }
    if (max_bytes <= 3) {
        return std::string(max_bytes, '.');
    }
    size_t cut = max_bytes - 3;
    // Back up over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return str.substr(0, cut) + "...";
}

// Join strings with a separator
inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace crew
