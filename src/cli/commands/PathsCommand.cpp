#include "cli/commands/PathsCommand.hpp"

#include <iostream>

#include "cli/CommitInput.hpp"
#include "core/LaneCalculator.hpp"
#include "core/PathGenerator.hpp"

namespace gitlanes {

/**
 * @brief Execute 'gitlanes paths' command
 * 
 * Output:
 *   segments: <n>
 *   geometry: lane-width <px>  row-height <px>  dot-radius <px>  curve <ratio>
 *   <type>\t<color>\t<path data>
 */
Expected<void> PathsCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    InputOptions options;
    LayoutConfig layout;

    for (size_t i = 0; i < args.size(); ++i) {
        auto consumed = consumeInputFlag(args, i, options);
        if (!consumed) return consumed.error();
        if (consumed.value()) continue;

        const std::string flag = args[i];
        if (flag != "--lane-width" && flag != "--row-height" && flag != "--dot-radius" &&
            flag != "--curve") {
            return Error{ErrorCode::InvalidArgs, "Unknown option: " + flag};
        }
        auto value = flagValue(args, i);
        if (!value) return value.error();
        auto number = parsePositive(flag, value.value());
        if (!number) return number.error();

        if (flag == "--lane-width") layout.laneWidth = number.value();
        else if (flag == "--row-height") layout.rowHeight = number.value();
        else if (flag == "--dot-radius") layout.dotRadius = number.value();
        else layout.curveControl = number.value();
    }

    if (layout.curveControl > 1.0) {
        return Error{ErrorCode::InvalidArgs, "--curve must be in (0, 1]"};
    }

    auto commits = loadCommits(ctx, options);
    if (!commits) return commits.error();

    GraphData graph = calculateLanes(commits.value());
    std::vector<PathSegment> paths = generatePaths(graph.lanes, commits.value(), layout);

    std::cout << "segments: " << paths.size() << "\n";
    std::cout << "geometry: lane-width " << formatCoordinate(layout.laneWidth)
              << "  row-height " << formatCoordinate(layout.rowHeight)
              << "  dot-radius " << formatCoordinate(layout.dotRadius)
              << "  curve " << formatCoordinate(layout.curveControl) << "\n";
    for (const auto& path : paths) {
        std::cout << pathTypeName(path.type) << "\t" << path.color << "\t" << path.d << "\n";
    }
    return {};
}

}
