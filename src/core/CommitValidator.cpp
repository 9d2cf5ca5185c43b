#include "core/CommitValidator.hpp"

#include <string>
#include <unordered_map>

namespace gitlanes {

Expected<void> validateCommits(const std::vector<Commit>& commits) {
    std::unordered_map<std::string, size_t> rowOf;
    rowOf.reserve(commits.size());

    for (size_t i = 0; i < commits.size(); ++i) {
        const Commit& commit = commits[i];
        if (commit.hash.empty()) {
            return Error{ErrorCode::InvalidCommit, "Commit at row " + std::to_string(i) + " has no hash"};
        }
        auto inserted = rowOf.emplace(commit.hash, i);
        if (!inserted.second) {
            return Error{ErrorCode::DuplicateCommit,
                         "Commit " + commit.hash + " appears at rows " +
                         std::to_string(inserted.first->second) + " and " + std::to_string(i)};
        }
    }

    for (size_t i = 0; i < commits.size(); ++i) {
        const Commit& commit = commits[i];
        for (const auto& parentHash : commit.parents) {
            if (parentHash.empty()) {
                return Error{ErrorCode::InvalidCommit, "Commit " + commit.hash + " has an empty parent hash"};
            }
            if (parentHash == commit.hash) {
                return Error{ErrorCode::OrderViolation, "Commit " + commit.hash + " lists itself as parent"};
            }
            auto it = rowOf.find(parentHash);
            if (it != rowOf.end() && it->second < i) {
                return Error{ErrorCode::OrderViolation,
                             "Parent " + parentHash + " (row " + std::to_string(it->second) +
                             ") is listed before its child " + commit.hash +
                             " (row " + std::to_string(i) + ")"};
            }
        }
    }

    return {};
}

}
