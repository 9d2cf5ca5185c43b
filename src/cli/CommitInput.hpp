#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/Commit.hpp"
#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace gitlanes {

/**
 * @brief Where a command gets its commit records from
 */
struct InputOptions {
    std::string inputPath;                              // Log file; empty reads ctx.input
    std::string remotesPath;                            // Optional remote hash list for isLocal
    size_t maxCount{Constants::DEFAULT_MAX_COUNT};      // 0 keeps every record
    bool validate{false};                               // Run validateCommits() after reading
};

/**
 * @brief Consume an input flag at args[i] if it is one
 * 
 * Handles --input, --remotes, --max-count and --validate, advancing i past
 * the flag's value.
 * 
 * @return true if the flag was consumed, false if it is not an input flag,
 *         InvalidArgs error if its value is missing or malformed
 */
Expected<bool> consumeInputFlag(const std::vector<std::string>& args, size_t& i, InputOptions& options);

/// Value following args[i]; InvalidArgs when there is none
Expected<std::string> flagValue(const std::vector<std::string>& args, size_t& i);

/// Non-negative integer flag value
Expected<size_t> parseCount(const std::string& flag, const std::string& value);

/// Finite, strictly positive number
Expected<double> parsePositive(const std::string& flag, const std::string& value);

/// Read, mark and optionally validate commits as described by options
Expected<std::vector<Commit>> loadCommits(const AppContext& ctx, const InputOptions& options);

}
