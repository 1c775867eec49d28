#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/CommitInfo.hpp"
#include "core/HeadInfo.hpp"
#include "core/TagInfo.hpp"
#include "util/Expected.hpp"
#include "util/FileSystem.hpp"
#include "util/Lazy.hpp"
#include "util/Timestamp.hpp"

namespace gitcontext {

struct ReaderOptions {
    /// Where discovery starts; the process working directory when unset
    std::optional<std::filesystem::path> startDirectory;

    /// Raise failures from accessors instead of returning defaults
    bool strict{false};

    /// File system capability; DiskFileSystem when null
    std::shared_ptr<const IFileSystem> fileSystem;
};

/**
 * @brief Reads commit metadata for the repository enclosing a directory
 *
 * Three values back the eight accessors, each computed at most once per
 * reader and shared by every accessor that needs it:
 *   HeadInfo           - commitHash(), branch(), isDetached()
 *   CommitInfo         - author(), date(), message(), parents()
 *   tag list for HEAD  - tags()
 * CommitInfo and the tag list both build on the cached HeadInfo.
 *
 * Accessors return deferred futures: the backing value is computed when the
 * first dependent future is awaited, on the awaiting thread. Concurrent
 * awaiters of the same value share one computation.
 *
 * Lenient mode (default): a failure is logged once and the accessor returns
 * its default (nullopt, false or an empty list). Strict mode: get() on the
 * future throws GitContextError with the failure's ErrorCode. A failure in
 * one value never affects a sibling value that already succeeded.
 *
 * The cached values live in state shared with every returned future, so a
 * future may be awaited after the reader itself has been destroyed.
 */
class RepositoryReader {
public:
    explicit RepositoryReader(ReaderOptions options = {});

    RepositoryReader(const RepositoryReader&) = delete;
    RepositoryReader& operator=(const RepositoryReader&) = delete;

    std::future<std::optional<std::string>> commitHash();
    std::future<std::optional<std::string>> branch();
    std::future<bool> isDetached();
    std::future<std::optional<std::string>> author();
    std::future<std::optional<Timestamp>> date();
    std::future<std::optional<std::string>> message();
    std::future<std::vector<std::string>> parents();
    std::future<std::vector<std::string>> tags();

    /// Cached records behind the accessors (errors are not policy-filtered)
    std::shared_future<Expected<HeadInfo>> headInfo();
    std::shared_future<Expected<CommitInfo>> commitInfo();
    std::shared_future<Expected<std::vector<TagInfo>>> tagInfos();

    /// Discovered .git directory, if any
    std::optional<std::filesystem::path> gitDirectory() const;

    const IFileSystem& fileSystem() const { return *state->files; }

private:
    /// Everything the accessors' futures need; shared so futures can outlive the reader
    struct State {
        State(std::shared_ptr<const IFileSystem> files, bool strictMode, Expected<std::filesystem::path> gitDir);

        State(const State&) = delete;
        State& operator=(const State&) = delete;

        Expected<HeadInfo> loadHead();
        Expected<CommitInfo> loadCommit();
        Expected<std::vector<TagInfo>> loadTags();

        /// Apply the strict/lenient policy: pointer to the value, nullptr, or throw
        template <typename T>
        const T* settle(const Expected<T>& result) const {
            if (result) return &result.value();
            if (strictMode) throw GitContextError(result.error());
            return nullptr;
        }

        /// Lenient mode hides failures from callers; leave a trace in the log
        void reportFailure(const char* what, const Error& err) const;

        std::shared_ptr<const IFileSystem> files;
        bool strictMode;
        Expected<std::filesystem::path> gitDir;

        Lazy<Expected<HeadInfo>> head;
        Lazy<Expected<CommitInfo>> commit;
        Lazy<Expected<std::vector<TagInfo>>> tagList;
    };

    /// Deferred future projecting a cached value, or fallback when absent
    template <typename Value, typename Result, typename Project>
    std::future<Result> derive(Lazy<Expected<Value>> State::*source, Result fallback, Project project) const;

    std::shared_ptr<State> state;
};

}
