#include "cli/commands/CheckCommand.hpp"

#include <iostream>

#include "cli/CommitInput.hpp"

namespace gitlanes {

Expected<void> CheckCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    InputOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        auto consumed = consumeInputFlag(args, i, options);
        if (!consumed) return consumed.error();
        if (!consumed.value()) {
            return Error{ErrorCode::InvalidArgs, "Unknown option: " + args[i]};
        }
    }
    options.validate = true;

    auto commits = loadCommits(ctx, options);
    if (!commits) return commits.error();

    size_t merges = 0;
    for (const auto& commit : commits.value()) {
        if (commit.isMerge) ++merges;
    }
    std::cout << "ok: " << commits.value().size() << " commits, " << merges << " merges\n";
    return {};
}

}
