#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include "core/ColorScheme.hpp"

using namespace gitlanes;

// Test: Decorations stripped from git log %D refs
TEST(ColorSchemeTest, NormalizeRefName) {
    EXPECT_EQ(ColorScheme::normalizeRefName("main"), "main");
    EXPECT_EQ(ColorScheme::normalizeRefName("HEAD -> main"), "main");
    EXPECT_EQ(ColorScheme::normalizeRefName("origin/main"), "main");
    EXPECT_EQ(ColorScheme::normalizeRefName("origin/feature/login"), "feature/login");
    EXPECT_EQ(ColorScheme::normalizeRefName("tag: v1.0"), "v1.0");
    EXPECT_EQ(ColorScheme::normalizeRefName("refs/heads/develop"), "develop");
    EXPECT_EQ(ColorScheme::normalizeRefName("refs/remotes/origin/develop"), "develop");
    EXPECT_EQ(ColorScheme::normalizeRefName("  feature  "), "feature");
}

// Test: Detached HEAD marker is not a branch name
TEST(ColorSchemeTest, BareHeadNormalizesToEmpty) {
    EXPECT_EQ(ColorScheme::normalizeRefName("HEAD"), "");
    EXPECT_EQ(ColorScheme::normalizeRefName(""), "");
}

// Test: main and master in every decoration
TEST(ColorSchemeTest, IsMainBranch) {
    EXPECT_TRUE(ColorScheme::isMainBranch("main"));
    EXPECT_TRUE(ColorScheme::isMainBranch("master"));
    EXPECT_TRUE(ColorScheme::isMainBranch("origin/main"));
    EXPECT_TRUE(ColorScheme::isMainBranch("HEAD -> master"));

    EXPECT_FALSE(ColorScheme::isMainBranch("maintenance"));
    EXPECT_FALSE(ColorScheme::isMainBranch("feature/main"));
    EXPECT_FALSE(ColorScheme::isMainBranch("HEAD"));
}

// Test: h = h * 31 + byte with 32-bit wrap-around
TEST(ColorSchemeTest, HashBranchNameKnownValues) {
    EXPECT_EQ(ColorScheme::hashBranchName(""), 0);
    EXPECT_EQ(ColorScheme::hashBranchName("a"), 97);
    EXPECT_EQ(ColorScheme::hashBranchName("ab"), 3105);
    EXPECT_EQ(ColorScheme::hashBranchName("hello"), 99162322);
    EXPECT_EQ(ColorScheme::hashBranchName("feature"), -979207434);
}

// Test: INT32_MIN hash still maps into the palette
TEST(ColorSchemeTest, BranchColorHandlesMinimumHash) {
    EXPECT_EQ(ColorScheme::hashBranchName("polygenelubricants"), INT32_MIN);
    // 2147483648 % 7 == 2
    EXPECT_EQ(ColorScheme::branchColor("polygenelubricants"), ColorScheme::palette()[2]);
}

// Test: Branch color is a pure function of the name
TEST(ColorSchemeTest, BranchColorIsDeterministic) {
    EXPECT_EQ(ColorScheme::branchColor("feature"), "#a855f7");
    EXPECT_EQ(ColorScheme::branchColor("feature-branch"), "#ec4899");
    EXPECT_EQ(ColorScheme::branchColor("develop"), "#6366f1");
    EXPECT_EQ(ColorScheme::branchColor("develop"), ColorScheme::branchColor("develop"));
}

// Test: Palette reserves amber for main
TEST(ColorSchemeTest, PaletteExcludesReservedColors) {
    const auto& palette = ColorScheme::palette();
    EXPECT_EQ(palette.size(), 7u);
    EXPECT_EQ(std::find(palette.begin(), palette.end(), ColorScheme::MAIN_COLOR), palette.end());
    EXPECT_EQ(std::find(palette.begin(), palette.end(), ColorScheme::ORPHAN_COLOR), palette.end());
}

// Test: Palette index wraps
TEST(ColorSchemeTest, PaletteColorWraps) {
    EXPECT_EQ(ColorScheme::paletteColor(0), "#3b82f6");
    EXPECT_EQ(ColorScheme::paletteColor(7), ColorScheme::paletteColor(0));
    EXPECT_EQ(ColorScheme::paletteColor(15), ColorScheme::paletteColor(1));
}
