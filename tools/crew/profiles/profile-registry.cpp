#include "profile-registry.h"
#include "../common/constants.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace crew {

const char* registry_status_to_string(registry_status status) {
    switch (status) {
        case registry_status::OK:             return "ok";
        case registry_status::DUPLICATE_ROLE: return "duplicate role";
        case registry_status::INVALID_NAME:   return "invalid name";
        default:                              return "unknown";
    }
}

bool profile_registry::validate_name(const std::string& name) {
    if (name.empty() || name.size() > config::MAX_ROLE_NAME_LENGTH) return false;
    if (name.front() == '-' || name.back() == '-') return false;

    bool prev_hyphen = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '-') {
            if (prev_hyphen) return false;
            prev_hyphen = true;
        } else if (std::islower(uc) || std::isdigit(uc)) {
            prev_hyphen = false;
        } else {
            return false;
        }
    }
    return true;
}

registry_status profile_registry::register_profile(const capability_profile& profile) {
    if (!validate_name(profile.name)) {
        return registry_status::INVALID_NAME;
    }
    if (lookup(profile.name) != nullptr) {
        return registry_status::DUPLICATE_ROLE;
    }

    // Keep sorted by name for consistent ordering in listings and prompts
    auto pos = std::lower_bound(profiles_.begin(), profiles_.end(), profile.name,
                                [](const capability_profile& p, const std::string& n) {
                                    return p.name < n;
                                });
    profiles_.insert(pos, profile);
    return registry_status::OK;
}

const capability_profile* profile_registry::lookup(const std::string& name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

std::vector<std::string> profile_registry::names() const {
    std::vector<std::string> result;
    result.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        result.push_back(profile.name);
    }
    return result;
}

std::string profile_registry::generate_prompt_section() const {
    if (profiles_.empty()) {
        return "";
    }

    std::ostringstream ss;
    ss << "<available_agents>\n";

    for (const auto& profile : profiles_) {
        ss << "<agent>\n";
        ss << "  <name>" << escape_xml(profile.name) << "</name>\n";
        ss << "  <description>" << escape_xml(profile.description) << "</description>\n";
        if (!profile.capability_set.empty()) {
            ss << "  <tools>" << escape_xml(join(profile.capability_set, " ")) << "</tools>\n";
        }
        ss << "</agent>\n";
    }

    ss << "</available_agents>\n";
    return ss.str();
}

} // namespace crew
