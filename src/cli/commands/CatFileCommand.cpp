#include "cli/commands/CatFileCommand.hpp"

#include <iostream>

#include "core/Constants.hpp"
#include "core/ObjectReader.hpp"
#include "core/RepositoryReader.hpp"

namespace gitcontext {

Expected<void> CatFileCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool typeOnly = false;
    std::string hash;
    for (const auto& arg : args) {
        if (arg == "-t") {
            typeOnly = true;
        } else if (hash.empty()) {
            hash = arg;
        } else {
            return Error{ErrorCode::InvalidArgs, "Unexpected argument: " + arg};
        }
    }
    if (hash.empty()) {
        return Error{ErrorCode::InvalidArgs, "Usage: gitcontext cat-file [-t] <object>"};
    }

    RepositoryReader reader(ctx.reader);
    auto gitDir = reader.gitDirectory();
    if (!gitDir) {
        return Error{ErrorCode::NotFound, "Not inside a git repository"};
    }

    auto readerRes = ObjectReader::open(reader.fileSystem(), *gitDir / Constants::OBJECTS_DIR, hash);
    if (!readerRes) return readerRes.error();
    ObjectReader& object = *readerRes.value();

    auto type = object.readHeader();
    if (!type) return type.error();
    if (typeOnly) {
        std::cout << type.value() << "\n";
        return {};
    }
    if (type.value() != Constants::TYPE_COMMIT && type.value() != Constants::TYPE_TAG) {
        return Error{ErrorCode::InvalidArgs, "Only commit and tag objects can be printed, got " + type.value()};
    }

    while (true) {
        auto field = object.readField();
        if (!field) return field.error();
        if (!field.value()) break;
        // Folded values go back out as continuation lines
        std::cout << field.value()->key << " ";
        for (char c : field.value()->value) {
            std::cout << c;
            if (c == '\n') std::cout << ' ';
        }
        std::cout << "\n";
    }
    auto body = object.readBody();
    if (!body) return body.error();

    std::cout << "\n" << body.value();
    return {};
}

}
