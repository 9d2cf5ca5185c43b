#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gitlanes {

/**
 * @brief Branch color policy for the commit graph
 * 
 * main/master always render in the reserved main color, disconnected
 * commits in gray, and every other branch in a palette entry picked by
 * hashing its name, so a branch keeps its color across renders even when
 * its lane index moves.
 */
namespace ColorScheme {

constexpr const char* MAIN_COLOR = "#f59e0b";    // amber
constexpr const char* ORPHAN_COLOR = "#6b7280";  // gray

/// Palette for non-main branches (main color excluded)
const std::vector<std::string>& palette();

/// Palette entry for an arbitrary index (wraps around)
const std::string& paletteColor(size_t index);

/**
 * @brief Strip decorations from a `git log %D` ref
 * 
 *   "HEAD -> main"        -> "main"
 *   "origin/feature/x"    -> "feature/x"
 *   "tag: v1.0"           -> "v1.0"
 *   "refs/heads/dev"      -> "dev"
 *   "HEAD"                -> ""  (detached HEAD marker, not a branch)
 */
std::string normalizeRefName(const std::string& ref);

/// True for main or master, after normalization
bool isMainBranch(const std::string& ref);

/**
 * @brief Java-style string hash: h = h * 31 + byte, wrapping at 32 bits
 * 
 * Computed over the UTF-8 bytes of the name. Stable across runs and
 * platforms.
 */
int32_t hashBranchName(const std::string& name);

/// Palette color for a branch name: palette[|hash| % size]
const std::string& branchColor(const std::string& name);

}  // namespace ColorScheme

}  // namespace gitlanes
