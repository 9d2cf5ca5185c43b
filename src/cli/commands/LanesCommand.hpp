#pragma once

#include "cli/ICommand.hpp"

namespace gitlanes {

class LanesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "lanes"; }
    const char* description() const override { return "Assign lanes and colors to commits"; }
    const char* helpNameLine() const override { return "lanes -  Show the lane layout of a commit list"; }
    const char* helpSynopsis() const override {
        return "gitlanes lanes [--input <file>] [--remotes <file>] [--max-count <n>] [--validate]";
    }
    const char* helpDescription() const override {
        return "Read commit records newest-first and print one row per commit: a text preview of the graph, "
               "the short hash, the branch color, the lane, the parent lanes already in flight, refs and subject.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--input <file>", "Read records from a plain or gzip-compressed file instead of stdin."},
            {"--remotes <file>", "Hashes reachable from remotes, one per line; other commits are marked local."},
            {"--max-count <n>", "Lay out at most n commits (default 50, 0 for all)."},
            {"--validate", "Reject duplicate hashes and lists that are not newest-first."},
        };
    }
};

}
