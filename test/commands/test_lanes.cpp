#include "command_test_fixture.hpp"
#include "cli/commands/LanesCommand.hpp"
#include "core/ColorScheme.hpp"

using namespace gitlanes;
using namespace gitlanes::test;
using namespace gitlanes::test::utils;

class LanesCommandTest : public CommandTest {};

// Test: Lanes from stdin
TEST_F(LanesCommandTest, LanesFromInputStream) {
    setInput(mergeLog);
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_TRUE(outputContains("commits: 4  max-lane: 1"));
    EXPECT_TRUE(outputContains("d  #f59e0b  lane 0  in []  (HEAD -> main) Merge c"));
    EXPECT_TRUE(outputContains("| *  c  " + ColorScheme::branchColor("feature") + "  lane 1  in []  (feature) Work on c"));
    EXPECT_TRUE(outputContains("b  #f59e0b  lane 0  in [1]  Work on b"));
}

// Test: Empty input prints an empty graph
TEST_F(LanesCommandTest, EmptyInput) {
    setInput("");
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(getOutput(), "commits: 0  max-lane: 0\n");
}

// Test: Lanes from a gzip file with max count
TEST_F(LanesCommandTest, LanesFromGzipFileWithMaxCount) {
    auto path = createGzipFile(tempDir, "log.gz", mergeLog);
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {"--input", path.string(), "--max-count", "2"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(outputContains("commits: 2  max-lane: 1"));
    EXPECT_FALSE(outputContains("Initial commit"));
}

// Test: Validation rejects oldest-first input
TEST_F(LanesCommandTest, ValidateRejectsReversedLog) {
    setInput("a|a|root|A|then||\nb|b|child|A|now|a|\n");
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {"--validate"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OrderViolation);
}

// Test: Without validation reversed input still lays out
TEST_F(LanesCommandTest, ReversedLogWithoutValidation) {
    setInput("a|a|root|A|then||\nb|b|child|A|now|a|\n");
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {});
    EXPECT_TRUE(result.has_value());
}

// Test: Unknown option
TEST_F(LanesCommandTest, UnknownOption) {
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {"--graph"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}

// Test: Bad max count
TEST_F(LanesCommandTest, InvalidMaxCount) {
    LanesCommand cmd;
    EXPECT_EQ(cmd.execute(ctx, {"--max-count", "-3"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {"--max-count"}).error().code, ErrorCode::InvalidArgs);
}

// Test: Missing input file
TEST_F(LanesCommandTest, MissingInputFile) {
    LanesCommand cmd;
    auto result = cmd.execute(ctx, {"--input", (tempDir / "nope.log").string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}
