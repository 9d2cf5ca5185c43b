#include "core/LaneCalculator.hpp"

#include <algorithm>
#include <unordered_map>

#include "core/ColorScheme.hpp"
#include "util/Logger.hpp"

namespace gitlanes {

std::optional<size_t> ActiveLanes::find(const std::string& hash) const {
    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i] && *slots[i] == hash) return i;
    }
    return std::nullopt;
}

size_t ActiveLanes::firstFree() const {
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) return i;
    }
    return slots.size();
}

size_t ActiveLanes::claim(const std::string& hash) {
    size_t lane = firstFree();
    assign(lane, hash);
    return lane;
}

void ActiveLanes::assign(size_t lane, const std::string& hash) {
    if (lane >= slots.size()) slots.resize(lane + 1);
    slots[lane] = hash;
}

void ActiveLanes::release(size_t lane) {
    if (lane < slots.size()) slots[lane].reset();
}

void ActiveLanes::releaseDuplicates(const std::string& hash, size_t keep) {
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i != keep && slots[i] && *slots[i] == hash) slots[i].reset();
    }
}

size_t ActiveLanes::activeCount() const {
    return static_cast<size_t>(std::count_if(slots.begin(), slots.end(),
        [](const auto& slot) { return slot.has_value(); }));
}

bool ActiveLanes::isActive(size_t lane) const {
    return lane < slots.size() && slots[lane].has_value();
}

namespace {

using ColorTable = std::unordered_map<std::string, std::string>;

std::vector<std::string> branchNames(const Commit& commit) {
    std::vector<std::string> names;
    for (const auto& ref : commit.refs) {
        std::string name = ColorScheme::normalizeRefName(ref);
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

std::string resolveColor(const Commit& commit, size_t lane, const ColorTable& colors) {
    for (const auto& ref : commit.refs) {
        if (ColorScheme::isMainBranch(ref)) return ColorScheme::MAIN_COLOR;
    }
    std::vector<std::string> names = branchNames(commit);
    if (!names.empty()) {
        return ColorScheme::branchColor(names.front());
    }

    auto own = colors.find(commit.hash);
    if (own != colors.end()) return own->second;

    if (commit.parents.empty()) return ColorScheme::ORPHAN_COLOR;

    auto parent = colors.find(commit.parents.front());
    if (parent != colors.end()) return parent->second;

    return ColorScheme::paletteColor(lane);
}

}

GraphData calculateLanes(const std::vector<Commit>& commits) {
    GraphData graph;
    graph.lanes.reserve(commits.size());

    ActiveLanes active;
    ColorTable colors;

    for (const auto& commit : commits) {
        // Lane: the one waiting for this commit, else the lowest free slot
        size_t lane;
        if (auto expected = active.find(commit.hash)) {
            lane = *expected;
            active.releaseDuplicates(commit.hash, lane);
        } else {
            lane = active.firstFree();
        }

        std::string color = resolveColor(commit, lane, colors);
        colors[commit.hash] = color;

        LaneAssignment assignment;
        assignment.commitHash = commit.hash;
        assignment.lane = lane;
        for (const auto& parentHash : commit.parents) {
            if (auto parentLane = active.find(parentHash)) {
                assignment.inLanes.push_back(*parentLane);
            }
        }
        assignment.outLanes.push_back(lane);
        assignment.color = color;

        graph.colorMap[lane] = color;
        graph.maxLane = std::max(graph.maxLane, lane);

        if (commit.parents.empty()) {
            active.release(lane);
        } else {
            active.assign(lane, commit.parents.front());
            colors.emplace(commit.parents.front(), color);

            for (size_t p = 1; p < commit.parents.size(); ++p) {
                const std::string& mergedHash = commit.parents[p];
                size_t mergeLane = active.claim(mergedHash);
                auto inserted = colors.emplace(mergedHash, ColorScheme::paletteColor(mergeLane));
                graph.colorMap.emplace(mergeLane, inserted.first->second);
            }
        }

        graph.lanes.push_back(std::move(assignment));
    }

    Logger::instance().debug("Laid out " + std::to_string(commits.size()) + " commits across " +
                             std::to_string(commits.empty() ? 0 : graph.maxLane + 1) + " lanes");
    return graph;
}

}
