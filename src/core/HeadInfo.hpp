#pragma once

#include <optional>
#include <string>

namespace gitcontext {

/**
 * @brief Resolved HEAD state
 *
 * Either attached to a branch:
 *   ref = "ref: refs/heads/main", branch = "main", isDetached = false
 * or detached:
 *   ref = commitHash, branch = nullopt, isDetached = true
 *
 * branch is set iff isDetached is false.
 */
struct HeadInfo {
    std::string ref;                    // Trimmed HEAD file content
    std::optional<std::string> branch;  // Branch name (without refs/heads/)
    std::string commitHash;             // Commit HEAD points at (40-hex)
    bool isDetached{false};
};

}
