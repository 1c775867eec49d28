#pragma once

#include "cli/ICommand.hpp"

namespace gitcontext {

class HeaderCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "header"; }
    const char* description() const override { return "Generate a C++ header with commit constants"; }
    const char* helpNameLine() const override { return "header -  Bake commit metadata into a C++ header"; }
    const char* helpSynopsis() const override {
        return "gitcontext [--dir <path>] [--strict] header [--namespace <ns>] [--output <file>]";
    }
    const char* helpDescription() const override {
        return "Write a header of inline constexpr constants (hash, branch, is_detached, author, date, "
               "message, parents, tags) for the commit HEAD points at. Missing values become "
               "std::nullopt or empty arrays. The output file is left untouched when its content "
               "would not change, so build systems do not rebuild needlessly.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--namespace <ns>", "Namespace for the constants (default: git_context)."},
            {"--output <file>", "Write to file instead of stdout."}
        };
    }
};

}
