#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/TagInfo.hpp"
#include "util/Expected.hpp"

namespace gitcontext {

class IFileSystem;

/**
 * @brief Resolves refs/tags/<name> files to the commits they tag
 *
 * A tag ref holds either the commit hash itself (lightweight tag) or the
 * hash of a tag object (annotated tag):
 *   object <commit-hash>
 *   type commit
 *   tag <name>
 *   tagger Name <email> <timestamp> <timezone>
 *
 *   <tag message>
 *
 * Only direct children of refs/tags are considered; nested namespaces such
 * as refs/tags/release/1.0 are not enumerated.
 */
class TagResolver {
public:
    /// @param gitDir Path to the .git directory
    TagResolver(const IFileSystem& fileSystem, std::filesystem::path gitDir);

    /**
     * @brief Resolve one tag ref
     * @param tagName File name under refs/tags
     * @param commitMatch When set, only a tag on this commit is accepted
     * @return The tag, an empty optional when the ref does not name a
     *         matching commit tag, or NotFound / MalformedObject / IoError
     *
     * A ref whose content equals commitMatch is a lightweight tag and is
     * returned without touching the object store. Without commitMatch a ref
     * to a commit object is also reported as a lightweight tag.
     */
    Expected<std::optional<TagInfo>> resolve(
        const std::string& tagName,
        const std::optional<std::string>& commitMatch = std::nullopt
    ) const;

    /**
     * @brief All tags pointing at commitHash, sorted by name
     *
     * Tags on other commits, tags of non-commit objects and refs that fail
     * to resolve are left out; failures are logged, never returned. Only an
     * unreadable refs/tags directory is an error.
     */
    Expected<std::vector<TagInfo>> listForCommit(const std::string& commitHash) const;

    std::filesystem::path tagsDir() const;

private:
    const IFileSystem& fileSystem;
    std::filesystem::path gitDir;
};

}
