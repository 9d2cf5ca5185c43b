#pragma once

#include "cli/ICommand.hpp"

namespace gitlanes {

class PathsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "paths"; }
    const char* description() const override { return "Emit SVG path data for commit edges"; }
    const char* helpNameLine() const override { return "paths -  Generate the connecting paths of the commit graph"; }
    const char* helpSynopsis() const override {
        return "gitlanes paths [--input <file>] [--max-count <n>] [--lane-width <px>] [--row-height <px>] [--dot-radius <px>] [--curve <ratio>]";
    }
    const char* helpDescription() const override {
        return "Lay out the commits and print one line per commit-to-parent edge: "
               "the edge type (line or merge), its color and the SVG path data. "
               "A geometry line echoes the layout the renderer should draw with.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--input <file>", "Read records from a plain or gzip-compressed file instead of stdin."},
            {"--max-count <n>", "Lay out at most n commits (default 50, 0 for all)."},
            {"--validate", "Reject duplicate hashes and lists that are not newest-first."},
            {"--lane-width <px>", "Horizontal distance between lanes (default 20)."},
            {"--row-height <px>", "Vertical distance between commits (default 28)."},
            {"--dot-radius <px>", "Radius of the commit dots the renderer draws (default 5)."},
            {"--curve <ratio>", "Bezier control point position along a merge edge (default 0.4)."},
        };
    }
};

}
