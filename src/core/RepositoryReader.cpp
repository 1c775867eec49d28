#include "core/RepositoryReader.hpp"

#include <utility>

#include "core/CommitParser.hpp"
#include "core/Constants.hpp"
#include "core/RefResolver.hpp"
#include "core/TagResolver.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

namespace {

std::shared_ptr<const IFileSystem> orDiskFileSystem(std::shared_ptr<const IFileSystem> fileSystem) {
    if (fileSystem) return fileSystem;
    return std::make_shared<DiskFileSystem>();
}

}

RepositoryReader::State::State(std::shared_ptr<const IFileSystem> fileSystem, bool strict,
                               Expected<fs::path> discovered)
    : files(std::move(fileSystem)),
      strictMode(strict),
      gitDir(std::move(discovered)),
      head([this] { return loadHead(); }),
      commit([this] { return loadCommit(); }),
      tagList([this] { return loadTags(); }) {}

RepositoryReader::RepositoryReader(ReaderOptions options) {
    auto files = orDiskFileSystem(std::move(options.fileSystem));
    auto gitDir = RefResolver(*files).discoverGitDir(options.startDirectory.value_or(files->currentDirectory()));
    if (!gitDir) {
        Logger::instance().debug(gitDir.error().message);
    }
    state = std::make_shared<State>(std::move(files), options.strict, std::move(gitDir));
}

std::optional<fs::path> RepositoryReader::gitDirectory() const {
    if (!state->gitDir) return std::nullopt;
    return state->gitDir.value();
}

void RepositoryReader::State::reportFailure(const char* what, const Error& err) const {
    if (!strictMode) {
        Logger::instance().warn(std::string(what) + " unavailable: " + err.message);
    }
}

Expected<HeadInfo> RepositoryReader::State::loadHead() {
    if (!gitDir) {
        reportFailure("HEAD", gitDir.error());
        return gitDir.error();
    }
    auto res = RefResolver(*files).resolveHead(gitDir.value());
    if (!res) reportFailure("HEAD", res.error());
    return res;
}

Expected<CommitInfo> RepositoryReader::State::loadCommit() {
    // A HEAD failure was already reported by loadHead
    std::shared_future<Expected<HeadInfo>> headFuture = head.get();
    const Expected<HeadInfo>& headRes = headFuture.get();
    if (!headRes) return headRes.error();

    CommitParser parser(*files, gitDir.value() / Constants::OBJECTS_DIR);
    auto res = parser.parse(headRes.value().commitHash);
    if (!res) reportFailure("Commit", res.error());
    return res;
}

Expected<std::vector<TagInfo>> RepositoryReader::State::loadTags() {
    if (!gitDir) {
        reportFailure("Tags", gitDir.error());
        return gitDir.error();
    }

    TagResolver resolver(*files, gitDir.value());
    if (!files->isDirectory(resolver.tagsDir())) {
        return std::vector<TagInfo>();
    }

    // A HEAD failure was already reported by loadHead
    std::shared_future<Expected<HeadInfo>> headFuture = head.get();
    const Expected<HeadInfo>& headRes = headFuture.get();
    if (!headRes) return headRes.error();

    auto res = resolver.listForCommit(headRes.value().commitHash);
    if (!res) reportFailure("Tags", res.error());
    return res;
}

std::shared_future<Expected<HeadInfo>> RepositoryReader::headInfo() { return state->head.get(); }
std::shared_future<Expected<CommitInfo>> RepositoryReader::commitInfo() { return state->commit.get(); }
std::shared_future<Expected<std::vector<TagInfo>>> RepositoryReader::tagInfos() { return state->tagList.get(); }

template <typename Value, typename Result, typename Project>
std::future<Result> RepositoryReader::derive(Lazy<Expected<Value>> State::*source, Result fallback,
                                             Project project) const {
    return std::async(std::launch::deferred,
                      [shared = state, source, fallback = std::move(fallback), project]() -> Result {
        std::shared_future<Expected<Value>> cached = ((*shared).*source).get();
        const Value* value = shared->settle(cached.get());
        if (!value) return fallback;
        return project(*value);
    });
}

std::future<std::optional<std::string>> RepositoryReader::commitHash() {
    return derive(&State::head, std::optional<std::string>(), [](const HeadInfo& info) {
        return std::optional<std::string>(info.commitHash);
    });
}

std::future<std::optional<std::string>> RepositoryReader::branch() {
    return derive(&State::head, std::optional<std::string>(), [](const HeadInfo& info) {
        return info.branch;
    });
}

std::future<bool> RepositoryReader::isDetached() {
    return derive(&State::head, false, [](const HeadInfo& info) {
        return info.isDetached;
    });
}

std::future<std::optional<std::string>> RepositoryReader::author() {
    return derive(&State::commit, std::optional<std::string>(), [](const CommitInfo& info) {
        return std::optional<std::string>(info.author);
    });
}

std::future<std::optional<Timestamp>> RepositoryReader::date() {
    return derive(&State::commit, std::optional<Timestamp>(), [](const CommitInfo& info) {
        return std::optional<Timestamp>(info.date);
    });
}

std::future<std::optional<std::string>> RepositoryReader::message() {
    return derive(&State::commit, std::optional<std::string>(), [](const CommitInfo& info) {
        return std::optional<std::string>(info.message);
    });
}

std::future<std::vector<std::string>> RepositoryReader::parents() {
    return derive(&State::commit, std::vector<std::string>(), [](const CommitInfo& info) {
        return info.parents;
    });
}

std::future<std::vector<std::string>> RepositoryReader::tags() {
    return derive(&State::tagList, std::vector<std::string>(), [](const std::vector<TagInfo>& infos) {
        std::vector<std::string> names;
        names.reserve(infos.size());
        for (const auto& info : infos) {
            names.push_back(info.tag);
        }
        return names;
    });
}

}
