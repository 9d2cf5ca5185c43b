#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/CheckCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LanesCommand.hpp"
#include "cli/commands/PathsCommand.hpp"

namespace gitlanes {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool CommandFactory::contains(const std::string& name) const {
    return creators.find(name) != creators.end();
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerBuiltinCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("lanes", [] { return std::make_unique<LanesCommand>(); });
    f.registerCreator("paths", [] { return std::make_unique<PathsCommand>(); });
    f.registerCreator("check", [] { return std::make_unique<CheckCommand>(); });
}

}
