#include "cli/commands/HeaderCommand.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "cli/HeaderRenderer.hpp"
#include "core/GitSnapshot.hpp"
#include "core/RepositoryReader.hpp"
#include "util/FileSystem.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

Expected<void> HeaderCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string ns = "git_context";
    std::string output;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if ((arg == "--namespace" || arg == "--output") && i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, arg + " requires a value"};
        }
        if (arg == "--namespace") {
            ns = args[++i];
        } else if (arg == "--output") {
            output = args[++i];
        } else {
            return Error{ErrorCode::InvalidArgs, "Unknown option: " + arg};
        }
    }
    if (!isValidNamespace(ns)) {
        return Error{ErrorCode::InvalidArgs, "Invalid namespace: " + ns};
    }

    RepositoryReader reader(ctx.reader);
    std::string header = renderHeader(GitSnapshot::collect(reader), ns);

    if (output.empty()) {
        std::cout << header;
        return {};
    }

    // Keep the timestamp of an up-to-date header
    DiskFileSystem disk;
    auto existing = disk.readText(output);
    if (existing && existing.value() == header) {
        Logger::instance().info(output + " is up to date");
        return {};
    }

    fs::path outPath(output);
    if (outPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create directory for " + output + ": " + ec.message()};
        }
    }

    std::ofstream out(outPath, std::ios::binary);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open output file: " + output};
    }
    out << header;
    out.flush();
    if (!out || !out.good()) {
        return Error{ErrorCode::IoError, "Failed to write output file: " + output};
    }
    Logger::instance().info("Wrote " + output);
    return {};
}

}
