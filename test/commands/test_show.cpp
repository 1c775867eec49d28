#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <sstream>
#include "test_utils.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/CatFileCommand.hpp"
#include "cli/commands/ShowCommand.hpp"

namespace fs = std::filesystem;

using namespace gitcontext;
using namespace gitcontext::test::utils;

class ShowCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        gitDir = initTestRepo(tempDir);
        parent = fakeHash(1);
        head = fakeHash(2);
        writeLooseObject(gitDir, parent, "commit", commitBody({}, "P <p@p.p> 1600000000 +0000", "Root\n"));
        writeLooseObject(gitDir, head, "commit",
                         commitBody({parent}, "A U Thor <a@b.c> 1700000000 +0200", "Second commit\n"));
        writeRef(gitDir, "refs/heads/main", head);
        writeRef(gitDir, "refs/tags/v1.0", head);
        ctx.reader.startDirectory = tempDir;

        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        removeDir(tempDir);
    }

    std::string getOutput() {
        return outputStream.str();
    }

    void clearOutput() {
        outputStream.str("");
        outputStream.clear();
    }

    fs::path tempDir;
    fs::path gitDir;
    std::string parent;
    std::string head;
    AppContext ctx;
    std::stringstream outputStream;
    std::streambuf* oldCout;
};

// Test: show prints every value in a fixed order
TEST_F(ShowCommandTest, ShowPrintsAllValues) {
    ShowCommand cmd;
    auto res = cmd.execute(ctx, {});
    ASSERT_TRUE(res.has_value()) << res.error().message;

    std::string expected =
        "Hash: " + head + "\n"
        "Author: A U Thor <a@b.c>\n"
        "Date: 2023-11-15T00:13:20+02:00\n"
        "IsDetached: false\n"
        "Branch: main\n"
        "Tags: v1.0\n"
        "Parents: " + parent + "\n"
        "Message: Second commit\n";
    EXPECT_EQ(getOutput(), expected);
}

// Test: show from a subdirectory finds the enclosing repository
TEST_F(ShowCommandTest, ShowFromSubdirectory) {
    fs::create_directories(tempDir / "src" / "lib");
    ctx.reader.startDirectory = tempDir / "src" / "lib";

    ShowCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    EXPECT_NE(getOutput().find("Hash: " + head), std::string::npos);
}

// Test: show rejects arguments
TEST_F(ShowCommandTest, ShowRejectsArguments) {
    ShowCommand cmd;
    auto res = cmd.execute(ctx, {"extra"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}

// Test: A corrupt HEAD commit in strict mode exits with the malformed code
TEST_F(ShowCommandTest, StrictShowOnCorruptCommit) {
    writeBytes(gitDir / "objects" / head.substr(0, 2) / head.substr(2), "corrupt");
    ctx.reader.strict = true;

    ShowCommand cmd;
    CommandInvoker invoker;
    auto res = invoker.invoke(cmd, ctx, {});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::MalformedObject);
    EXPECT_EQ(CommandInvoker::exitCode(res), 4);
}

// Test: The same corruption in lenient mode prints empty commit values
TEST_F(ShowCommandTest, LenientShowOnCorruptCommit) {
    writeBytes(gitDir / "objects" / head.substr(0, 2) / head.substr(2), "corrupt");

    ShowCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    std::string output = getOutput();
    EXPECT_NE(output.find("Hash: " + head + "\n"), std::string::npos);
    EXPECT_NE(output.find("Author: \n"), std::string::npos);
    EXPECT_NE(output.find("Branch: main\n"), std::string::npos);
}

// Test: cat-file prints a commit's fields and message
TEST_F(ShowCommandTest, CatFileCommit) {
    CatFileCommand cmd;
    auto res = cmd.execute(ctx, {head});
    ASSERT_TRUE(res.has_value()) << res.error().message;

    std::string output = getOutput();
    EXPECT_NE(output.find("parent " + parent + "\n"), std::string::npos);
    EXPECT_NE(output.find("author A U Thor <a@b.c> 1700000000 +0200\n"), std::string::npos);
    EXPECT_NE(output.find("\nSecond commit\n"), std::string::npos);
}

// Test: cat-file -t prints only the type, even for blobs
TEST_F(ShowCommandTest, CatFileType) {
    std::string blob = fakeHash(3);
    writeLooseObject(gitDir, blob, "blob", "data");

    CatFileCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {"-t", blob}).has_value());
    EXPECT_EQ(getOutput(), "blob\n");

    clearOutput();
    auto res = cmd.execute(ctx, {blob});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}

// Test: cat-file argument errors
TEST_F(ShowCommandTest, CatFileErrors) {
    CatFileCommand cmd;
    auto none = cmd.execute(ctx, {});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::InvalidArgs);

    auto missing = cmd.execute(ctx, {fakeHash(42)});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto bad = cmd.execute(ctx, {"xyz"});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::MalformedObject);
}

// Test: cat-file writes folded header values back as continuation lines
TEST_F(ShowCommandTest, CatFileSignedCommit) {
    std::string signedCommit = fakeHash(4);
    std::string body =
        "tree " + fakeHash(9) + "\n"
        "parent " + head + "\n"
        "author S <s@s.s> 1700000000 +0000\n"
        "committer S <s@s.s> 1700000000 +0000\n"
        "gpgsig -----BEGIN PGP SIGNATURE-----\n"
        " \n"
        " iQEzBAABCAAdFiEE\n"
        " -----END PGP SIGNATURE-----\n"
        "\n"
        "Signed change\n";
    writeLooseObject(gitDir, signedCommit, "commit", body);

    CatFileCommand cmd;
    auto res = cmd.execute(ctx, {signedCommit});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(getOutput(), body);
}
