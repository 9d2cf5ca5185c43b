#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/Commit.hpp"
#include "util/Expected.hpp"

namespace gitlanes {

/**
 * @brief Reader for `git log` output in the graph record format
 * 
 * Expected format, one commit per line:
 *   git log --all --max-count=<n> --format='%H|%h|%s|%an|%ar|%P|%D'
 * 
 * Fields: full hash, short hash, subject, author, date, space-separated
 * parents, comma-separated ref decorations. The subject may itself contain
 * '|', so the first two fields are taken from the left, the last four from
 * the right, and whatever remains in between is the subject.
 * 
 * Files go through zlib's gz layer, which reads plain text unchanged, so
 * gzip-compressed log dumps need no special handling.
 */
namespace CommitLogReader {

/**
 * @brief Parse one record line
 * @param line Line without trailing newline
 * @param lineNumber 1-based line number for error messages
 * @return Commit, or MalformedRecord when fields are missing
 */
Expected<Commit> parseLine(const std::string& line, size_t lineNumber);

/**
 * @brief Parse records from a stream
 * @param in Text stream, one record per line; blank lines are skipped
 * @param maxCount Keep at most this many commits (0 = all)
 */
Expected<std::vector<Commit>> parse(std::istream& in, size_t maxCount = 0);

/**
 * @brief Read records from a plain or gzip-compressed file
 * @param path Log file
 * @param maxCount Keep at most this many commits (0 = all)
 * @return Commits, IoError if the file cannot be read, MalformedRecord on bad lines
 */
Expected<std::vector<Commit>> readFile(const std::filesystem::path& path, size_t maxCount = 0);

/**
 * @brief Read a set of hashes, one per line (`git log --remotes --format=%H`)
 */
Expected<std::unordered_set<std::string>> readHashSet(const std::filesystem::path& path);

/**
 * @brief Mark commits not reachable from a remote as local
 * 
 * isLocal becomes true exactly when the commit's hash is absent from
 * remoteHashes.
 */
void markLocalCommits(std::vector<Commit>& commits, const std::unordered_set<std::string>& remoteHashes);

}  // namespace CommitLogReader

}  // namespace gitlanes
