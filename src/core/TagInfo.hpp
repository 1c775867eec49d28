#pragma once

#include <optional>
#include <string>

namespace gitcontext {

/**
 * @brief A tag pointing at a commit
 *
 * Lightweight tags have no message; annotated tags carry the tag object's
 * body (which may be empty but is present).
 */
struct TagInfo {
    std::string commit;                  // Target commit hash
    std::string tag;                     // Tag name (ref file name under refs/tags)
    std::optional<std::string> message;  // Set for annotated tags only

    bool isAnnotated() const { return message.has_value(); }
};

}
