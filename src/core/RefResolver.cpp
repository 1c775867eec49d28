#include "core/RefResolver.hpp"

#include "core/Constants.hpp"
#include "util/FileSystem.hpp"
#include "util/Logger.hpp"
#include "util/ObjectId.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

RefResolver::RefResolver(const IFileSystem& fileSystem) : fileSystem(fileSystem) {}

bool RefResolver::isGitDirectory(const fs::path& candidate) const {
    return fileSystem.isDirectory(candidate)
        && fileSystem.isRegularFile(candidate / Constants::HEAD_FILE)
        && fileSystem.isDirectory(candidate / Constants::OBJECTS_DIR);
}

Expected<fs::path> RefResolver::discoverGitDir(const fs::path& start) const {
    fs::path cur = start.is_absolute() ? start : fileSystem.currentDirectory() / start;
    cur = cur.lexically_normal();
    // "/a/b/" normalizes with an empty filename; walk from "/a/b"
    if (!cur.has_filename() && cur.has_relative_path()) {
        cur = cur.parent_path();
    }

    while (true) {
        fs::path gd = cur / Constants::GIT_DIR;
        if (isGitDirectory(gd)) {
            Logger::instance().debug("Found git directory " + gd.string());
            return gd;
        }
        fs::path parent = cur.parent_path();
        if (parent.empty() || parent == cur) {
            return Error{ErrorCode::NotFound, "Git directory not found from " + start.string()};
        }
        cur = parent;
    }
}

Expected<HeadInfo> RefResolver::resolveHead(const fs::path& gitDir) const {
    fs::path headPath = gitDir / Constants::HEAD_FILE;
    if (!fileSystem.isRegularFile(headPath)) {
        return Error{ErrorCode::NotFound, "HEAD file not found"};
    }

    auto headRes = fileSystem.readText(headPath);
    if (!headRes) return headRes.error();
    std::string headContent = StringUtils::trim(headRes.value());

    if (!StringUtils::startsWith(headContent, Constants::SYMREF_PREFIX)) {
        // Detached HEAD (direct commit hash)
        if (!isValidHash(headContent)) {
            return Error{ErrorCode::MalformedObject, "Invalid commit hash in HEAD"};
        }
        Logger::instance().debug("HEAD is detached at " + shortHash(headContent));
        return HeadInfo{headContent, std::nullopt, headContent, true};
    }

    // HEAD points to a branch: "ref: refs/heads/<branch>"
    std::string refPath = headContent.substr(std::char_traits<char>::length(Constants::SYMREF_PREFIX));
    if (!StringUtils::startsWith(refPath, Constants::HEADS_REF_PREFIX)) {
        return Error{ErrorCode::MalformedObject, "Invalid HEAD format: " + headContent};
    }
    std::string branch = refPath.substr(std::char_traits<char>::length(Constants::HEADS_REF_PREFIX));
    if (branch.empty()) {
        return Error{ErrorCode::MalformedObject, "Invalid HEAD format: empty branch name"};
    }
    fs::path refRelative(refPath);
    for (const auto& part : refRelative) {
        if (part == "..") {
            return Error{ErrorCode::MalformedObject, "Invalid HEAD format: " + headContent};
        }
    }

    fs::path refFile = gitDir / refRelative;
    if (!fileSystem.isRegularFile(refFile)) {
        // Unborn branch: no commits yet
        return Error{ErrorCode::NotFound, "Branch ref not found: " + refPath};
    }

    auto refRes = fileSystem.readText(refFile);
    if (!refRes) return refRes.error();
    std::string commitHash = StringUtils::trim(refRes.value());
    if (!isValidHash(commitHash)) {
        return Error{ErrorCode::MalformedObject, "Invalid commit hash in " + refPath};
    }

    Logger::instance().debug("HEAD is on branch " + branch + " at " + shortHash(commitHash));
    return HeadInfo{headContent, branch, commitHash, false};
}

}
