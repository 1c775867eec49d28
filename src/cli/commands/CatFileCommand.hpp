#pragma once

#include "cli/ICommand.hpp"

namespace gitcontext {

class CatFileCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "cat-file"; }
    const char* description() const override { return "Decode a loose commit or tag object"; }
    const char* helpNameLine() const override { return "cat-file -  Provide content of a loose object"; }
    const char* helpSynopsis() const override { return "gitcontext [--dir <path>] cat-file [-t] <object>"; }
    const char* helpDescription() const override {
        return "Inflate the loose object with the given 40-hex id and print its type, header fields "
               "and body. Packed objects are not supported.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-t", "Show only the object type."} };
    }
};

}
