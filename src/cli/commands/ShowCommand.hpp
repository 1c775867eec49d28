#pragma once

#include "cli/ICommand.hpp"

namespace gitcontext {

class ShowCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Print the commit metadata of HEAD"; }
    const char* helpNameLine() const override { return "show -  Show HEAD commit metadata"; }
    const char* helpSynopsis() const override { return "gitcontext [--dir <path>] [--strict] show"; }
    const char* helpDescription() const override {
        return "Print hash, author, date, detached state, branch, tags, parents and message of the "
               "commit HEAD points at, read directly from the .git directory.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
