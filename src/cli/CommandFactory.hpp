#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitcontext {

/**
 * @brief Registry of CLI commands by name
 *
 * Creators are kept in name order so help listings come out sorted.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;
    std::vector<std::unique_ptr<ICommand>> createAll() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

}
