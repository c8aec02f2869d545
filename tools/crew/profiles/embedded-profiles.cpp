#include "embedded-profiles.h"
#include "../strategies/pipeline-strategy.h"

namespace crew {
namespace embedded {

const std::vector<capability_profile>& builtin_profiles() {
    static const std::vector<capability_profile> profiles = {
        {
            "scout",
            "Fast read-only codebase reconnaissance. Returns compressed findings for handoff to other roles.",
            {"read", "grep", "find", "ls"},
            R"(You are a scout. Quickly investigate the codebase and return structured findings
that another agent can use without re-reading everything.

Output format:
## Files Retrieved
List exact paths with line ranges and a one-line note each.

## Key Code
Critical types, interfaces or functions, quoted verbatim.

## Start Here
Which file to look at first and why.)",
            false,
        },
        {
            "planner",
            "Turns findings and requirements into a concrete, ordered implementation plan. Read-only.",
            {"read", "grep", "find", "ls"},
            R"(You are a planner. You receive context and requirements and produce a clear
implementation plan. You must NOT make any changes; only read, analyze and plan.

Output format:
## Goal
One sentence.

## Plan
Numbered, small, actionable steps naming the files to modify.

## Risks
Anything to watch out for.)",
            false,
        },
        {
            "builder",
            "General-purpose implementer with full read-write capabilities.",
            {"read", "bash", "edit", "write"},
            R"(You are a builder. Work autonomously to complete the assigned task using the
tools you have. When finished, summarize what you changed, listing every file
touched, and anything the caller should verify.)",
            false,
        },
        {
            "reviewer",
            "Reviews changes for correctness, security and maintainability. Does not modify files.",
            {"read", "grep", "find", "ls", "bash"},
            R"(You are a senior code reviewer. Use bash only for read-only commands such as
git diff, git log and git show. Never modify files.

Output format:
## Critical (must fix)
## Warnings (should fix)
## Suggestions
## Summary)",
            false,
        },
    };
    return profiles;
}

std::vector<pipeline_step> default_pipeline() {
    return {
        {"scout", "Find all code relevant to: {task}"},
        {"planner", "Create an implementation plan for \"{task}\" using this context:\n\n{previous}"},
        {"builder", "Implement this plan:\n\n{previous}\n\nOriginal request: {task}"},
    };
}

} // namespace embedded

int register_builtin_profiles(profile_registry& registry) {
    int count = 0;
    for (const auto& profile : embedded::builtin_profiles()) {
        if (registry.register_profile(profile) == registry_status::OK) {
            count++;
        }
    }
    return count;
}

} // namespace crew
