#pragma once

#include <filesystem>
#include <string>

#include "core/HeadInfo.hpp"
#include "util/Expected.hpp"

namespace gitcontext {

class IFileSystem;

/**
 * @brief Locates the .git directory and resolves HEAD
 *
 * Repository layout consulted:
 *   .git/
 *     HEAD              - "ref: refs/heads/<branch>" or a bare 40-hex hash
 *     objects/          - Loose objects
 *     refs/
 *       heads/<branch>  - Branch tip commit hash
 *
 * All file access goes through IFileSystem, so both operations are pure
 * functions of the tree they are pointed at.
 */
class RefResolver {
public:
    explicit RefResolver(const IFileSystem& fileSystem);

    /**
     * @brief Find the .git directory by searching upwards
     * @param start Starting directory (relative paths are taken from the
     *              file system's current directory)
     * @return Absolute path to <root>/.git, or NotFound
     *
     * A level matches when <dir>/.git is a directory holding a HEAD file and
     * an objects/ directory. Walks up until a match or the filesystem root.
     */
    Expected<std::filesystem::path> discoverGitDir(const std::filesystem::path& start) const;

    /// Does candidate look like a usable .git directory?
    bool isGitDirectory(const std::filesystem::path& candidate) const;

    /**
     * @brief Resolve HEAD to a branch and/or commit
     * @param gitDir Path to the .git directory
     * @return HeadInfo, or
     *   NotFound         - no HEAD file, or the branch has no ref file yet
     *   MalformedObject  - symbolic ref outside refs/heads/, or a target
     *                      that is not a valid hash
     */
    Expected<HeadInfo> resolveHead(const std::filesystem::path& gitDir) const;

private:
    const IFileSystem& fileSystem;
};

}
