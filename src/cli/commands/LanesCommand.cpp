#include "cli/commands/LanesCommand.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "cli/CommitInput.hpp"
#include "core/LaneCalculator.hpp"

namespace gitlanes {

namespace {

/**
 * @brief Text preview of the graph, one string per row
 * 
 * '*' marks the commit, '|' a lane carrying an edge past the row. An edge
 * is drawn in its parent's lane, which is where a merge curve settles.
 */
std::vector<std::string> renderGutter(const GraphData& graph, const std::vector<Commit>& commits) {
    const size_t width = graph.maxLane + 1;
    std::vector<std::string> rows(commits.size(), std::string(width, ' '));

    std::unordered_map<std::string, size_t> rowOf;
    for (size_t i = 0; i < commits.size(); ++i) {
        rowOf.emplace(commits[i].hash, i);
    }

    for (size_t i = 0; i < commits.size(); ++i) {
        for (const auto& parentHash : commits[i].parents) {
            auto it = rowOf.find(parentHash);
            if (it == rowOf.end() || it->second <= i) continue;
            size_t lane = graph.lanes[it->second].lane;
            for (size_t r = i + 1; r < it->second; ++r) {
                rows[r][lane] = '|';
            }
        }
    }
    for (size_t i = 0; i < commits.size(); ++i) {
        rows[i][graph.lanes[i].lane] = '*';
    }

    for (auto& row : rows) {
        std::string spaced;
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) spaced += ' ';
            spaced += row[c];
        }
        row = spaced;
    }
    return rows;
}

std::string joinLanes(const std::vector<size_t>& lanes) {
    std::ostringstream out;
    for (size_t i = 0; i < lanes.size(); ++i) {
        if (i > 0) out << ',';
        out << lanes[i];
    }
    return out.str();
}

std::string joinRefs(const std::vector<std::string>& refs) {
    std::string out;
    for (const auto& ref : refs) {
        if (!out.empty()) out += ", ";
        out += ref;
    }
    return out;
}

}

/**
 * @brief Execute 'gitlanes lanes' command
 * 
 * Output:
 *   commits: <n>  max-lane: <m>
 *   <gutter>  <short-hash>  <color>  lane <l>  in [<lanes>]  [(<refs>)] <subject>
 */
Expected<void> LanesCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    InputOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        auto consumed = consumeInputFlag(args, i, options);
        if (!consumed) return consumed.error();
        if (!consumed.value()) {
            return Error{ErrorCode::InvalidArgs, "Unknown option: " + args[i]};
        }
    }

    auto commits = loadCommits(ctx, options);
    if (!commits) return commits.error();

    GraphData graph = calculateLanes(commits.value());

    std::cout << "commits: " << graph.lanes.size() << "  max-lane: " << graph.maxLane << "\n";
    if (graph.lanes.empty()) return {};

    std::vector<std::string> gutter = renderGutter(graph, commits.value());
    for (size_t i = 0; i < graph.lanes.size(); ++i) {
        const Commit& commit = commits.value()[i];
        const LaneAssignment& lane = graph.lanes[i];
        std::cout << gutter[i] << "  " << commit.displayHash() << "  " << lane.color
                  << "  lane " << lane.lane << "  in [" << joinLanes(lane.inLanes) << "]  ";
        if (!commit.refs.empty()) {
            std::cout << "(" << joinRefs(commit.refs) << ") ";
        }
        std::cout << commit.message << "\n";
    }
    return {};
}

}
