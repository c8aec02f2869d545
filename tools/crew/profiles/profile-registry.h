#pragma once

#include "../common/crew-common.h"

#include <string>
#include <vector>

namespace crew {

// Role definition. Produced by an external loader (or the built-in set);
// never mutated once registered.
struct capability_profile {
    std::string name;                          // Required: role name
    std::string description;                   // Required: when to use this role
    std::vector<std::string> capability_set;   // Ordered whitelist of tool ids (empty = no tools)
    std::string instructions;                  // Instruction text for the child
    bool full_identity_replace = false;        // Replace the child's default instructions instead of appending
};

enum class registry_status {
    OK,
    DUPLICATE_ROLE,
    INVALID_NAME,
};

const char* registry_status_to_string(registry_status status);

// Holds named role definitions for the orchestration strategies
class profile_registry {
public:
    // Register a profile. Names are unique; the first registration wins.
    registry_status register_profile(const capability_profile& profile);

    // Get profile by name (returns nullptr if not found)
    const capability_profile* lookup(const std::string& name) const;

    // All profiles, sorted by name
    const std::vector<capability_profile>& list() const { return profiles_; }

    std::vector<std::string> names() const;

    bool empty() const { return profiles_.empty(); }
    size_t size() const { return profiles_.size(); }

    // Generate prompt section for strategy instructions (lists available roles)
    std::string generate_prompt_section() const;

    // 1-64 characters, lowercase letters, numbers, hyphens.
    // Cannot start or end with hyphen, no consecutive hyphens.
    static bool validate_name(const std::string& name);

private:
    std::vector<capability_profile> profiles_;
};

} // namespace crew
