// gitlanes: lay out `git log` output as a lane graph.

#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace gitlanes;

int main(int argc, char** argv) {
    registerBuiltinCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty() || args.front() == "--help" || args.front() == "-h") {
        auto cmd = CommandFactory::instance().create("help");
        return invoker.invoke(*cmd, ctx, {}) ? 0 : 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        Logger::instance().error("Unknown command: " + cmdName);
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
