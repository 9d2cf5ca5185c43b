#pragma once

#include <cstddef>

/**
 * @brief Layout and input constants used throughout the codebase
 * 
 * Centralizes magic numbers to improve maintainability and readability.
 */
namespace gitlanes {

namespace Constants {
    // Graph geometry (pixels)
    constexpr double LANE_WIDTH = 20.0;           // Horizontal spacing between lanes
    constexpr double ROW_HEIGHT = 28.0;           // Vertical spacing between commits
    constexpr double DOT_RADIUS = 5.0;            // Commit dot radius
    constexpr double CURVE_CONTROL = 0.4;         // Bezier control point ratio along the edge

    // Commit log input
    constexpr size_t DEFAULT_MAX_COUNT = 50;      // Default number of commits laid out
    constexpr size_t LOG_FIELD_COUNT = 7;         // %H|%h|%s|%an|%ar|%P|%D
    constexpr char LOG_FIELD_SEPARATOR = '|';
    constexpr size_t SHORT_HASH_LENGTH = 7;       // Fallback abbreviation when %h is empty
    constexpr size_t READ_BUFFER_SIZE = 8192;     // gzgets chunk size
}
}
