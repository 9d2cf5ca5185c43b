#include <gtest/gtest.h>

#include "cli/CommandFactory.hpp"

/**
 * @brief Main entry point for gitlanes unit tests
 * 
 * Registers the built-in commands once so help and factory tests see them.
 * Run with: ./gitlanes_tests
 * 
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    gitlanes::registerBuiltinCommands();
    return RUN_ALL_TESTS();
}
