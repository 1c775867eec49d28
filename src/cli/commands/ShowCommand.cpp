#include "cli/commands/ShowCommand.hpp"

#include <iostream>

#include "core/GitSnapshot.hpp"
#include "core/RepositoryReader.hpp"

namespace gitcontext {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

}

Expected<void> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "show takes no arguments"};
    }

    RepositoryReader reader(ctx.reader);
    GitSnapshot snapshot = GitSnapshot::collect(reader);

    std::cout << "Hash: " << snapshot.hash.value_or("") << "\n";
    std::cout << "Author: " << snapshot.author.value_or("") << "\n";
    std::cout << "Date: " << (snapshot.date ? snapshot.date->toIso8601() : "") << "\n";
    std::cout << "IsDetached: " << (snapshot.isDetached ? "true" : "false") << "\n";
    std::cout << "Branch: " << snapshot.branch.value_or("") << "\n";
    std::cout << "Tags: " << join(snapshot.tags) << "\n";
    std::cout << "Parents: " << join(snapshot.parents) << "\n";
    std::cout << "Message: " << snapshot.message.value_or("");
    if (!snapshot.message || snapshot.message->empty() || snapshot.message->back() != '\n') {
        std::cout << "\n";
    }
    return {};
}

}
