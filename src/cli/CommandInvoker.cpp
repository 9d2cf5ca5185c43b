#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace gitlanes {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name() +
                             " (" + std::to_string(args.size()) + " args)");
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": [" + errorCodeName(res.error().code) + "] " +
                                 res.error().message);
        return res;
    }
    return {};
}

}
