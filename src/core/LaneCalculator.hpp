#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Commit.hpp"

namespace gitlanes {

/**
 * @brief Lane placement of a single commit
 */
struct LaneAssignment {
    std::string commitHash;         // Commit this row belongs to
    size_t lane{0};                 // Horizontal slot (0 = leftmost)
    std::vector<size_t> inLanes;    // Active lanes already expecting one of this commit's parents
    std::vector<size_t> outLanes;   // Lanes leaving this commit (currently just {lane})
    std::string color;              // Hex color of the commit's branch line
};

/**
 * @brief Result of a layout pass
 */
struct GraphData {
    std::vector<LaneAssignment> lanes;         // One entry per input commit, same order
    size_t maxLane{0};                         // Highest lane index used (0 when empty)
    std::map<size_t, std::string> colorMap;    // Lane -> color last drawn or reserved in it
};

/**
 * @brief Lanes currently reserved for a commit that has not been reached yet
 *
 * Slot i holds the hash lane i is waiting for, or nothing when the lane is
 * free. The vector only grows; freed slots are handed out again lowest
 * index first.
 */
class ActiveLanes {
public:
    /// Lowest lane expecting the given hash
    std::optional<size_t> find(const std::string& hash) const;

    /// Lowest free lane, or size() when every slot is taken
    size_t firstFree() const;

    /// Reserve the lowest free lane (appending if needed) for a hash
    size_t claim(const std::string& hash);

    /// Make lane expect a hash, growing the table when lane == size()
    void assign(size_t lane, const std::string& hash);

    /// Free a lane; no-op for lanes past the end
    void release(size_t lane);

    /// Free every lane expecting hash except the one given
    void releaseDuplicates(const std::string& hash, size_t keep);

    size_t size() const { return slots.size(); }
    size_t activeCount() const;
    bool isActive(size_t lane) const;

private:
    std::vector<std::optional<std::string>> slots;
};

/**
 * @brief Assign a lane and a color to every commit
 *
 * Walks the commits once, newest first. A commit takes the lane that was
 * waiting for it (some newer commit listed it as a parent) or opens a new
 * lane in the lowest free slot. Its first parent then inherits that lane;
 * every further parent of a merge opens a lane of its own.
 *
 * Color precedence, first match wins:
 *   1. a main/master ref                 -> ColorScheme::MAIN_COLOR
 *   2. any other ref                     -> ColorScheme::branchColor(first ref)
 *   3. color handed down by a child      -> kept
 *   4. no refs and no parents            -> ColorScheme::ORPHAN_COLOR
 *   5. first parent already colored      -> inherited
 *   6. otherwise                         -> palette entry for the lane
 *
 * Parents missing from the list (cut off by --max-count) are tolerated:
 * they simply never show up in inLanes. The input order is trusted; use
 * validateCommits() to reject lists that are not newest-first.
 *
 * @param commits Commits in `git log` order
 * @return Lane assignments, highest lane index and lane color map
 */
GraphData calculateLanes(const std::vector<Commit>& commits);

}
