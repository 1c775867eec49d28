#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace gitcontext {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << opt << " :  " << desc << "\n\n";
        }
    }
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*cmd);
            return {};
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }

    std::cout << "usage: gitcontext [--dir <path>] [--strict] <command> [<args>]\n\n";
    std::cout << "Global options:\n"
              << "  --dir <path>\tStart repository discovery at <path> (default: current directory)\n"
              << "  --strict\tFail on unreadable repository data instead of printing empty values\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : CommandFactory::instance().createAll()) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    std::cout << "\nSet GITCONTEXT_LOG=debug|info|warn|error to control diagnostics.\n";
    return {};
}

}
