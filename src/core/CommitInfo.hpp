#pragma once

#include <string>
#include <vector>

#include "util/Timestamp.hpp"

namespace gitcontext {

/**
 * @brief Author identity as recorded in a commit header
 *
 * Git format: author Name <email> <timestamp> <timezone>
 */
struct Signature {
    std::string name;
    std::string email;
    Timestamp when;

    /// "Name <email>"
    std::string display() const { return name + " <" + email + ">"; }
};

/**
 * @brief Parsed HEAD commit
 *
 * Git commit format:
 *   commit <size>\0tree <hash>
 *   parent <hash>
 *   author Name <email> <timestamp> <timezone>
 *   committer Name <email> <timestamp> <timezone>
 *
 *   <commit message>
 *
 * Only the fields published by the reader are kept. All of them are
 * required; a commit missing one does not produce a CommitInfo at all.
 */
struct CommitInfo {
    std::string hash;                  // SHA-1 hash of this commit
    std::string author;                // "Name <email>"
    Timestamp date;                    // Author date at the author's offset
    std::string message;               // Raw message, trailing newline kept
    std::vector<std::string> parents;  // 0 for root, 1+ for merges, file order

    /**
     * @brief Get short commit message (first line only)
     */
    std::string shortMessage() const {
        size_t newlinePos = message.find('\n');
        if (newlinePos != std::string::npos) {
            return message.substr(0, newlinePos);
        }
        return message;
    }
};

}
