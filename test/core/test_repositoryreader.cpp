#include <gtest/gtest.h>
#include <filesystem>
#include <future>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include "test_utils.hpp"
#include "core/GitSnapshot.hpp"
#include "core/ObjectReader.hpp"
#include "core/RepositoryReader.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace gitcontext;
using namespace gitcontext::test::utils;
using gitcontext::test::InMemoryFileSystem;

class RepositoryReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mem = std::make_shared<InMemoryFileSystem>();
        gitDir = mem->addRepository("/work/project", "ref: refs/heads/main\n");
        mem->addDirectory("/work/project/src/module");
        mem->addDirectory("/elsewhere");

        parent = fakeHash(1);
        head = fakeHash(2);
        mem->addObject(gitDir, parent, "commit", commitBody({}, "P <p@p.p> 1600000000 +0000", "Parent\n"));
        mem->addObject(gitDir, head, "commit",
                       commitBody({parent}, "A U Thor <a@b.c> 1700000000 +0200", "Add feature\n\nDetails\n"));
        mem->addFile(gitDir / "refs/heads/main", head + "\n");
    }

    std::unique_ptr<RepositoryReader> makeReader(bool strict = false,
                                                 const fs::path& start = "/work/project/src/module") {
        ReaderOptions options;
        options.startDirectory = start;
        options.strict = strict;
        options.fileSystem = mem;
        return std::make_unique<RepositoryReader>(options);
    }

    fs::path headObjectPath() const {
        return ObjectReader::objectPath(gitDir / "objects", head);
    }

    std::shared_ptr<InMemoryFileSystem> mem;
    fs::path gitDir;
    std::string parent;
    std::string head;
};

// Test: Every accessor on a repository with an attached HEAD
TEST_F(RepositoryReaderTest, ReadsAllValues) {
    mem->addFile(gitDir / "refs/tags/v1.0", head + "\n");
    auto readerPtr = makeReader();
    RepositoryReader& reader = *readerPtr;

    ASSERT_TRUE(reader.gitDirectory().has_value());
    EXPECT_EQ(*reader.gitDirectory(), gitDir);

    EXPECT_EQ(reader.commitHash().get(), std::optional<std::string>(head));
    EXPECT_EQ(reader.branch().get(), std::optional<std::string>("main"));
    EXPECT_FALSE(reader.isDetached().get());
    EXPECT_EQ(reader.author().get(), std::optional<std::string>("A U Thor <a@b.c>"));

    auto date = reader.date().get();
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->epochSeconds, 1700000000);
    EXPECT_EQ(date->offsetMinutes, 120);

    EXPECT_EQ(reader.message().get(), std::optional<std::string>("Add feature\n\nDetails\n"));
    EXPECT_EQ(reader.parents().get(), std::vector<std::string>{parent});
    EXPECT_EQ(reader.tags().get(), std::vector<std::string>{"v1.0"});
}

// Test: No repository in lenient mode yields defaults everywhere
TEST_F(RepositoryReaderTest, LenientWithoutRepository) {
    auto reader = makeReader(false, "/elsewhere");
    EXPECT_FALSE(reader->gitDirectory().has_value());

    EXPECT_FALSE(reader->commitHash().get().has_value());
    EXPECT_FALSE(reader->branch().get().has_value());
    EXPECT_FALSE(reader->isDetached().get());
    EXPECT_FALSE(reader->author().get().has_value());
    EXPECT_FALSE(reader->date().get().has_value());
    EXPECT_FALSE(reader->message().get().has_value());
    EXPECT_TRUE(reader->parents().get().empty());
    EXPECT_TRUE(reader->tags().get().empty());
}

// Test: No repository in strict mode raises NotFound from the accessors
TEST_F(RepositoryReaderTest, StrictWithoutRepository) {
    auto reader = makeReader(true, "/elsewhere");

    try {
        reader->commitHash().get();
        FAIL() << "Expected GitContextError";
    } catch (const GitContextError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    EXPECT_THROW(reader->author().get(), GitContextError);
    EXPECT_THROW(reader->tags().get(), GitContextError);
}

// Test: Building the reader and its futures reads nothing
TEST_F(RepositoryReaderTest, ComputationIsDeferred) {
    auto reader = makeReader();
    auto author = reader->author();
    auto tags = reader->tags();
    EXPECT_EQ(mem->totalReads(), 0u);

    EXPECT_TRUE(author.get().has_value());
    EXPECT_EQ(mem->readCount(gitDir / "HEAD"), 1u);
    EXPECT_EQ(mem->readCount(headObjectPath()), 1u);
}

// Test: Accessors that share a value read its files once
TEST_F(RepositoryReaderTest, ValuesAreMemoized) {
    auto reader = makeReader();
    for (int i = 0; i < 3; ++i) {
        reader->commitHash().get();
        reader->branch().get();
        reader->isDetached().get();
        reader->author().get();
        reader->date().get();
        reader->message().get();
        reader->parents().get();
        reader->tags().get();
    }

    EXPECT_EQ(mem->readCount(gitDir / "HEAD"), 1u);
    EXPECT_EQ(mem->readCount(gitDir / "refs/heads/main"), 1u);
    EXPECT_EQ(mem->readCount(headObjectPath()), 1u);
    // The parent commit is never opened
    EXPECT_EQ(mem->readCount(ObjectReader::objectPath(gitDir / "objects", parent)), 0u);
}

// Test: Concurrent awaiters share one computation
TEST_F(RepositoryReaderTest, ConcurrentAccessorsReadOnce) {
    auto reader = makeReader();
    std::vector<std::thread> threads;
    std::vector<std::optional<std::string>> authors(8);
    for (size_t i = 0; i < authors.size(); ++i) {
        threads.emplace_back([&reader, &authors, i] {
            authors[i] = (i % 2 == 0) ? reader->author().get() : reader->message().get();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < authors.size(); ++i) {
        ASSERT_TRUE(authors[i].has_value());
    }
    EXPECT_EQ(mem->readCount(gitDir / "HEAD"), 1u);
    EXPECT_EQ(mem->readCount(headObjectPath()), 1u);
}

// Test: Detached HEAD reports no branch
TEST_F(RepositoryReaderTest, DetachedHead) {
    mem->addFile(gitDir / "HEAD", parent + "\n");
    auto reader = makeReader();

    EXPECT_EQ(reader->commitHash().get(), std::optional<std::string>(parent));
    EXPECT_TRUE(reader->isDetached().get());
    EXPECT_FALSE(reader->branch().get().has_value());
    EXPECT_EQ(reader->message().get(), std::optional<std::string>("Parent\n"));
    EXPECT_TRUE(reader->parents().get().empty());
}

// Test: A broken commit does not disturb HEAD values in strict mode
TEST_F(RepositoryReaderTest, StrictCommitFailureIsIsolated) {
    std::string broken = fakeHash(3);
    mem->addObject(gitDir, broken, "commit", "tree " + fakeHash(9) + "\n\nno author\n");
    mem->addFile(gitDir / "refs/heads/main", broken + "\n");
    auto reader = makeReader(true);

    EXPECT_EQ(reader->commitHash().get(), std::optional<std::string>(broken));
    try {
        reader->author().get();
        FAIL() << "Expected GitContextError";
    } catch (const GitContextError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MalformedObject);
    }
    EXPECT_THROW(reader->parents().get(), GitContextError);
    EXPECT_EQ(reader->branch().get(), std::optional<std::string>("main"));
    EXPECT_TRUE(reader->tags().get().empty());

    // The failure is cached, not retried
    EXPECT_EQ(mem->readCount(ObjectReader::objectPath(gitDir / "objects", broken)), 1u);
}

// Test: The same failure in lenient mode falls back to defaults
TEST_F(RepositoryReaderTest, LenientCommitFailure) {
    std::string broken = fakeHash(3);
    mem->addObject(gitDir, broken, "commit", "tree " + fakeHash(9) + "\n\nno author\n");
    mem->addFile(gitDir / "refs/heads/main", broken + "\n");
    auto reader = makeReader();

    EXPECT_EQ(reader->commitHash().get(), std::optional<std::string>(broken));
    EXPECT_FALSE(reader->author().get().has_value());
    EXPECT_FALSE(reader->date().get().has_value());
    EXPECT_FALSE(reader->message().get().has_value());
    EXPECT_TRUE(reader->parents().get().empty());
}

// Test: A fresh repository whose branch has no commits yet
TEST_F(RepositoryReaderTest, UnbornBranch) {
    auto fresh = std::make_shared<InMemoryFileSystem>();
    fresh->addRepository("/fresh", "ref: refs/heads/main\n");

    ReaderOptions options;
    options.startDirectory = fs::path("/fresh");
    options.strict = true;
    options.fileSystem = fresh;
    RepositoryReader reader(options);

    auto headRes = reader.headInfo().get();
    ASSERT_FALSE(headRes.has_value());
    EXPECT_EQ(headRes.error().code, ErrorCode::NotFound);
    EXPECT_THROW(reader.commitHash().get(), GitContextError);
}

// Test: Tags are empty when refs/tags is absent, even with HEAD unresolved
TEST_F(RepositoryReaderTest, MissingTagsDirectory) {
    auto bare = std::make_shared<InMemoryFileSystem>();
    bare->addDirectory("/bare/.git/objects");
    bare->addFile("/bare/.git/HEAD", "ref: refs/heads/main\n");

    ReaderOptions options;
    options.startDirectory = fs::path("/bare");
    options.strict = true;
    options.fileSystem = bare;
    RepositoryReader reader(options);

    EXPECT_TRUE(reader.tags().get().empty());
    EXPECT_THROW(reader.commitHash().get(), GitContextError);
}

// Test: Relative start directories resolve against the current directory
TEST_F(RepositoryReaderTest, RelativeStartDirectory) {
    mem->setCurrentDirectory("/work/project/src");
    auto reader = makeReader(false, "module");
    ASSERT_TRUE(reader->gitDirectory().has_value());
    EXPECT_EQ(*reader->gitDirectory(), gitDir);
}

// Test: Snapshot gathers every value at once
TEST_F(RepositoryReaderTest, SnapshotCollect) {
    std::string tagObject = fakeHash(4);
    mem->addObject(gitDir, tagObject, "tag", tagBody(head, "commit", "v2", "Two\n"));
    mem->addFile(gitDir / "refs/tags/v2", tagObject + "\n");
    mem->addFile(gitDir / "refs/tags/v1", head + "\n");
    auto reader = makeReader();

    GitSnapshot snapshot = GitSnapshot::collect(*reader);
    EXPECT_EQ(snapshot.hash, std::optional<std::string>(head));
    EXPECT_EQ(snapshot.branch, std::optional<std::string>("main"));
    EXPECT_FALSE(snapshot.isDetached);
    EXPECT_EQ(snapshot.author, std::optional<std::string>("A U Thor <a@b.c>"));
    ASSERT_TRUE(snapshot.date.has_value());
    EXPECT_EQ(snapshot.date->epochSeconds, 1700000000);
    EXPECT_EQ(snapshot.parents, std::vector<std::string>{parent});
    EXPECT_EQ(snapshot.tags, (std::vector<std::string>{"v1", "v2"}));

    // The cached records behind the accessors
    auto tagInfos = reader->tagInfos().get();
    ASSERT_TRUE(tagInfos.has_value());
    ASSERT_EQ(tagInfos.value().size(), 2u);
    EXPECT_FALSE(tagInfos.value()[0].isAnnotated());
    ASSERT_TRUE(tagInfos.value()[1].isAnnotated());
    EXPECT_EQ(*tagInfos.value()[1].message, "Two\n");

    auto commitInfo = reader->commitInfo().get();
    ASSERT_TRUE(commitInfo.has_value());
    EXPECT_EQ(commitInfo.value().hash, head);
}

// Test: A lenient failure is logged once, however often it is observed
TEST_F(RepositoryReaderTest, LenientFailureLoggedOnce) {
    std::string broken = fakeHash(3);
    mem->addObject(gitDir, broken, "commit", "tree " + fakeHash(9) + "\n\nno author\n");
    mem->addFile(gitDir / "refs/heads/main", broken + "\n");

    std::ostringstream log;
    LogLevel saved = Logger::instance().level();
    Logger::instance().setLevel(LogLevel::Warn);
    Logger::instance().setStream(log);

    auto reader = makeReader();
    reader->author().get();
    reader->message().get();
    reader->date().get();
    reader->parents().get();

    Logger::instance().resetStream();
    Logger::instance().setLevel(saved);

    std::string output = log.str();
    size_t first = output.find("Commit unavailable");
    ASSERT_NE(first, std::string::npos) << output;
    EXPECT_EQ(output.find("Commit unavailable", first + 1), std::string::npos) << output;
}

// Test: Futures stay valid after the reader that made them is gone
TEST_F(RepositoryReaderTest, FuturesOutliveReader) {
    std::future<std::optional<std::string>> author;
    std::future<std::vector<std::string>> tags;
    {
        mem->addFile(gitDir / "refs/tags/v1.0", head + "\n");
        auto reader = makeReader();
        author = reader->author();
        tags = reader->tags();
    }
    EXPECT_EQ(mem->totalReads(), 0u);

    EXPECT_EQ(author.get(), std::optional<std::string>("A U Thor <a@b.c>"));
    EXPECT_EQ(tags.get(), std::vector<std::string>{"v1.0"});
}

// Test: A strict failure still surfaces after the reader is gone
TEST_F(RepositoryReaderTest, StrictFutureOutlivesReader) {
    std::future<std::optional<std::string>> hash;
    {
        auto reader = makeReader(true, "/elsewhere");
        hash = reader->commitHash();
    }
    try {
        hash.get();
        FAIL() << "Expected GitContextError";
    } catch (const GitContextError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

// Test: The tag directory is listed once and each tag is resolved once
TEST_F(RepositoryReaderTest, TagScanIsMemoized) {
    std::string tagObject = fakeHash(5);
    mem->addObject(gitDir, tagObject, "tag", tagBody(head, "commit", "v1.0", "One\n"));
    mem->addFile(gitDir / "refs/tags/v1.0", tagObject + "\n");
    auto reader = makeReader();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(reader->tags().get(), std::vector<std::string>{"v1.0"});
    }

    EXPECT_EQ(mem->readCount(gitDir / "refs/tags"), 1u);
    EXPECT_EQ(mem->readCount(gitDir / "refs/tags/v1.0"), 1u);
    EXPECT_EQ(mem->readCount(ObjectReader::objectPath(gitDir / "objects", tagObject)), 1u);
}

// Test: Concurrent tags() callers share one directory scan
TEST_F(RepositoryReaderTest, ConcurrentTagScanReadsOnce) {
    std::string tagObject = fakeHash(5);
    mem->addObject(gitDir, tagObject, "tag", tagBody(head, "commit", "v1.0", "One\n"));
    mem->addFile(gitDir / "refs/tags/v1.0", tagObject + "\n");
    mem->addFile(gitDir / "refs/tags/light", head + "\n");
    auto reader = makeReader();

    std::vector<std::thread> threads;
    std::vector<std::vector<std::string>> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&reader, &results, i] {
            results[i] = reader->tags().get();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& names : results) {
        EXPECT_EQ(names, (std::vector<std::string>{"light", "v1.0"}));
    }
    EXPECT_EQ(mem->readCount(gitDir / "refs/tags"), 1u);
    EXPECT_EQ(mem->readCount(gitDir / "refs/tags/v1.0"), 1u);
    EXPECT_EQ(mem->readCount(gitDir / "refs/tags/light"), 1u);
    EXPECT_EQ(mem->readCount(ObjectReader::objectPath(gitDir / "objects", tagObject)), 1u);
}

// Test: Awaiting only tags() outside a repository still logs the failure
TEST_F(RepositoryReaderTest, LenientTagsWithoutRepositoryLogged) {
    std::ostringstream log;
    LogLevel saved = Logger::instance().level();
    Logger::instance().setLevel(LogLevel::Warn);
    Logger::instance().setStream(log);

    auto reader = makeReader(false, "/elsewhere");
    EXPECT_TRUE(reader->tags().get().empty());
    EXPECT_TRUE(reader->tags().get().empty());

    Logger::instance().resetStream();
    Logger::instance().setLevel(saved);

    std::string output = log.str();
    size_t first = output.find("Tags unavailable");
    ASSERT_NE(first, std::string::npos) << output;
    EXPECT_EQ(output.find("Tags unavailable", first + 1), std::string::npos) << output;
}
