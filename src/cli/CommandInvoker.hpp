#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace gitcontext {

/**
 * @brief Runs a command and reports its failure
 *
 * Strict-mode GitContextError exceptions escaping a command are turned into
 * an Error here, so main only deals with Expected results.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Process exit status for a command result
    static int exitCode(const Expected<void>& result);
};

}
