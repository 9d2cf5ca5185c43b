#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitlanes {

/**
 * @brief Registry of gitlanes subcommands by name
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One fresh instance of every registered command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

/// Register help, lanes, paths and check with the factory
void registerBuiltinCommands();

}
