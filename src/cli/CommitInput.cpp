#include "cli/CommitInput.hpp"

#include <cmath>
#include <exception>

#include "core/CommitLogReader.hpp"
#include "core/CommitValidator.hpp"
#include "util/Logger.hpp"

namespace gitlanes {

Expected<std::string> flagValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        return Error{ErrorCode::InvalidArgs, "Missing value for " + args[i]};
    }
    ++i;
    return args[i];
}

Expected<size_t> parseCount(const std::string& flag, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, flag + " expects a non-negative integer, got '" + value + "'"};
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, flag + " value out of range: " + value};
    }
}

Expected<double> parsePositive(const std::string& flag, const std::string& value) {
    double parsed = 0.0;
    size_t used = 0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, flag + " expects a number, got '" + value + "'"};
    }
    if (used != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
        return Error{ErrorCode::InvalidArgs, flag + " expects a positive number, got '" + value + "'"};
    }
    return parsed;
}

Expected<bool> consumeInputFlag(const std::vector<std::string>& args, size_t& i, InputOptions& options) {
    const std::string& flag = args[i];
    if (flag == "--validate") {
        options.validate = true;
        return true;
    }
    if (flag != "--input" && flag != "--remotes" && flag != "--max-count") {
        return false;
    }

    auto value = flagValue(args, i);
    if (!value) return value.error();

    if (flag == "--input") {
        options.inputPath = value.value();
    } else if (flag == "--remotes") {
        options.remotesPath = value.value();
    } else {
        auto count = parseCount(flag, value.value());
        if (!count) return count.error();
        options.maxCount = count.value();
    }
    return true;
}

Expected<std::vector<Commit>> loadCommits(const AppContext& ctx, const InputOptions& options) {
    Expected<std::vector<Commit>> commits = options.inputPath.empty()
        ? CommitLogReader::parse(*ctx.input, options.maxCount)
        : CommitLogReader::readFile(options.inputPath, options.maxCount);
    if (!commits) return commits.error();

    if (!options.remotesPath.empty()) {
        auto remotes = CommitLogReader::readHashSet(options.remotesPath);
        if (!remotes) return remotes.error();
        CommitLogReader::markLocalCommits(commits.value(), remotes.value());
    }

    if (options.validate) {
        auto valid = validateCommits(commits.value());
        if (!valid) return valid.error();
    }

    Logger::instance().debug("Loaded " + std::to_string(commits.value().size()) + " commits");
    return commits;
}

}
