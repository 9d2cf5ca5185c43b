#pragma once

#include "cli/ICommand.hpp"

namespace gitlanes {

class CheckCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "check"; }
    const char* description() const override { return "Validate a commit list before layout"; }
    const char* helpNameLine() const override { return "check -  Verify commit records are well formed and newest-first"; }
    const char* helpSynopsis() const override { return "gitlanes check [--input <file>] [--max-count <n>]"; }
    const char* helpDescription() const override {
        return "Parse the commit records and verify every commit has a unique hash and "
               "appears before all of its ancestors in the list. Parents outside the list are allowed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--input <file>", "Read records from a plain or gzip-compressed file instead of stdin."},
            {"--max-count <n>", "Check only the first n commits (default 50, 0 for all)."},
        };
    }
};

}
