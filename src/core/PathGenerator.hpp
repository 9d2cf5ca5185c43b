#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/Commit.hpp"
#include "core/Constants.hpp"
#include "core/LaneCalculator.hpp"

namespace gitlanes {

enum class PathType {
    Line,    // Parent in the same lane: straight vertical segment
    Merge,   // Parent in another lane: cubic Bezier
    Branch   // Reserved; not produced
};

/// "line", "merge" or "branch"
const char* pathTypeName(PathType type);

/**
 * @brief Drawable edge between a commit and one of its parents
 */
struct PathSegment {
    std::string d;                  // SVG path data (M, L and C commands only)
    std::string color;              // Color of the child commit
    PathType type{PathType::Line};
};

/**
 * @brief Graph geometry, in pixels
 */
struct LayoutConfig {
    double laneWidth{Constants::LANE_WIDTH};
    double rowHeight{Constants::ROW_HEIGHT};
    double dotRadius{Constants::DOT_RADIUS};     // Read by the renderer; paths end at dot centers
    double curveControl{Constants::CURVE_CONTROL};

    /// X coordinate of a lane's center line
    double laneX(size_t lane) const { return static_cast<double>(lane) * laneWidth; }

    /// Y coordinate of a row's center
    double rowY(size_t row) const { return static_cast<double>(row) * rowHeight + rowHeight / 2; }
};

/**
 * @brief Format a coordinate for SVG path data
 *
 * Shortest round-trippable form at 12 significant digits: 14, 20, 25.2.
 */
std::string formatCoordinate(double value);

/**
 * @brief Build the connecting paths of a laid-out graph
 *
 * For every commit i and each of its parents found in the list, emits
 *   - "M x y1 L x y2"                     when both share a lane (Line)
 *   - "M x1 y1 C x1 cy, x2 cy, x2 y2"     otherwise (Merge)
 * where cy = y1 + (y2 - y1) * curveControl, which leaves the curve
 * vertical at both ends. Segments take the child's color so an edge
 * belongs to the branch it leaves from.
 *
 * Parents outside the list are skipped. lanes[i] must describe commits[i];
 * extra entries on either side are ignored.
 *
 * @param lanes Output of calculateLanes() for the same commits
 * @param commits Commits in the order given to calculateLanes()
 * @param layout Geometry to draw with
 * @return Path segments in commit order, then parent order
 */
std::vector<PathSegment> generatePaths(const std::vector<LaneAssignment>& lanes,
                                       const std::vector<Commit>& commits,
                                       const LayoutConfig& layout = LayoutConfig{});

}
