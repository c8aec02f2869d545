#pragma once

// Built-in role definitions shipped with the binary.
// Config profiles cannot shadow these names.

#include "profile-registry.h"

#include <vector>

namespace crew {

struct pipeline_step;

namespace embedded {

// scout, planner, builder, reviewer
const std::vector<capability_profile>& builtin_profiles();

// scout -> planner -> builder, used when no pipeline is configured
std::vector<pipeline_step> default_pipeline();

} // namespace embedded

// Register every built-in profile. Returns the number registered.
int register_builtin_profiles(profile_registry& registry);

} // namespace crew
