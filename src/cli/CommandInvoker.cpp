#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace gitcontext {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name()
                             + (ctx.reader.strict ? " (strict)" : ""));
    Expected<void> res;
    try {
        res = cmd.execute(ctx, args);
    } catch (const GitContextError& e) {
        res = Error{e.code(), e.what()};
    }
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message
                                 + " (" + toString(res.error().code) + ")");
    }
    return res;
}

int CommandInvoker::exitCode(const Expected<void>& result) {
    if (result) return 0;
    switch (result.error().code) {
        case ErrorCode::InvalidArgs: return 2;
        case ErrorCode::NotFound: return 3;
        case ErrorCode::MalformedObject: return 4;
        default: return 1;
    }
}

}
