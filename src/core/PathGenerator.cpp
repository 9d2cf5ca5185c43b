#include "core/PathGenerator.hpp"

#include <algorithm>
#include <iomanip>
#include <locale>
#include <sstream>
#include <unordered_map>

#include "util/Logger.hpp"

namespace gitlanes {

const char* pathTypeName(PathType type) {
    switch (type) {
        case PathType::Line: return "line";
        case PathType::Merge: return "merge";
        case PathType::Branch: return "branch";
    }
    return "line";
}

std::string formatCoordinate(double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(12) << value;
    return out.str();
}

namespace {

PathSegment straightPath(double x, double fromY, double toY, const std::string& color) {
    std::string d = "M " + formatCoordinate(x) + " " + formatCoordinate(fromY) +
                    " L " + formatCoordinate(x) + " " + formatCoordinate(toY);
    return PathSegment{std::move(d), color, PathType::Line};
}

PathSegment curvedPath(double fromX, double toX, double fromY, double toY,
                       double curveControl, const std::string& color) {
    double controlY = fromY + (toY - fromY) * curveControl;
    std::string x1 = formatCoordinate(fromX);
    std::string x2 = formatCoordinate(toX);
    std::string cy = formatCoordinate(controlY);
    std::string d = "M " + x1 + " " + formatCoordinate(fromY) +
                    " C " + x1 + " " + cy + ", " + x2 + " " + cy + ", " +
                    x2 + " " + formatCoordinate(toY);
    return PathSegment{std::move(d), color, PathType::Merge};
}

}

std::vector<PathSegment> generatePaths(const std::vector<LaneAssignment>& lanes,
                                       const std::vector<Commit>& commits,
                                       const LayoutConfig& layout) {
    std::vector<PathSegment> paths;

    size_t rows = std::min(lanes.size(), commits.size());
    if (lanes.size() != commits.size()) {
        Logger::instance().warn("Lane count " + std::to_string(lanes.size()) +
                                " does not match commit count " + std::to_string(commits.size()));
    }

    // Hash -> row; the first occurrence wins
    std::unordered_map<std::string, size_t> rowOf;
    rowOf.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        rowOf.emplace(commits[i].hash, i);
    }

    for (size_t i = 0; i < rows; ++i) {
        const LaneAssignment& current = lanes[i];
        double currentY = layout.rowY(i);

        for (const auto& parentHash : commits[i].parents) {
            auto it = rowOf.find(parentHash);
            if (it == rowOf.end()) continue;  // Parent outside the visible window

            size_t parentRow = it->second;
            const LaneAssignment& parent = lanes[parentRow];
            double parentY = layout.rowY(parentRow);

            if (current.lane == parent.lane) {
                paths.push_back(straightPath(layout.laneX(current.lane), currentY, parentY, current.color));
            } else {
                paths.push_back(curvedPath(layout.laneX(current.lane), layout.laneX(parent.lane),
                                           currentY, parentY, layout.curveControl, current.color));
            }
        }
    }

    Logger::instance().debug("Generated " + std::to_string(paths.size()) + " path segments");
    return paths;
}

}
