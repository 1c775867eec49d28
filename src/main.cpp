// CLI entry using Command Pattern over the repository reader.

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/CatFileCommand.hpp"
#include "cli/commands/HeaderCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ShowCommand.hpp"

using namespace gitcontext;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("show", [] { return std::make_unique<ShowCommand>(); });
    f.registerCreator("header", [] { return std::make_unique<HeaderCommand>(); });
    f.registerCreator("cat-file", [] { return std::make_unique<CatFileCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // Global options come before the command name
    AppContext ctx{};
    size_t pos = 0;
    while (pos < args.size() && args[pos].rfind("--", 0) == 0) {
        if (args[pos] == "--strict") {
            ctx.reader.strict = true;
            ++pos;
        } else if (args[pos] == "--dir" && pos + 1 < args.size()) {
            ctx.reader.startDirectory = args[pos + 1];
            pos += 2;
        } else {
            std::cerr << "Unknown option: " << args[pos] << "\n";
            return 2;
        }
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(pos));

    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        return CommandInvoker::exitCode(invoker.invoke(*cmd, ctx, {}));
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return CommandInvoker::exitCode(res);
}
