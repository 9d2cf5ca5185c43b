#pragma once

#include <string>
#include <vector>

namespace gitlanes {

/**
 * @brief One row of a `git log` listing
 * 
 * Records arrive newest-first, the order `git log` prints them. Only
 * hash, parents and refs take part in the layout; the rest is display
 * metadata carried through for the renderer.
 */
struct Commit {
    std::string hash;                  // Full commit hash
    std::string shortHash;             // Abbreviated hash (%h)
    std::string message;               // Subject line
    std::string author;                // Author name
    std::string date;                  // Relative or absolute date, as printed
    std::vector<std::string> parents;  // Parent hashes, first parent first (empty for roots)
    std::vector<std::string> refs;     // Decorations: "HEAD -> main", "origin/main", "tag: v1"
    bool isLocal{true};                // Not reachable from any remote-tracking ref
    bool isMerge{false};               // Two or more parents

    bool isRoot() const { return parents.empty(); }

    /**
     * @brief Abbreviated hash, falling back to the first 7 characters
     */
    std::string displayHash() const {
        if (!shortHash.empty()) return shortHash;
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }
};

}
