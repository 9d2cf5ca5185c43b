#include "core/CommitLogReader.hpp"

#include <sstream>
#include <vector>

#include <zlib.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitlanes {

namespace CommitLogReader {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(Constants::LOG_FIELD_SEPARATOR, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::vector<std::string> splitParents(const std::string& field) {
    std::vector<std::string> parents;
    std::istringstream iss(field);
    std::string token;
    while (iss >> token) {
        parents.push_back(token);
    }
    return parents;
}

std::vector<std::string> splitRefs(const std::string& field) {
    std::vector<std::string> refs;
    size_t start = 0;
    while (start <= field.size()) {
        size_t pos = field.find(", ", start);
        std::string ref = trim(field.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!ref.empty()) refs.push_back(ref);
        if (pos == std::string::npos) break;
        start = pos + 2;
    }
    return refs;
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

/**
 * @brief Read every line of a file through gzread
 */
Expected<std::vector<std::string>> readLines(const fs::path& path) {
    gzFile file = gzopen(path.string().c_str(), "rb");
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open " + path.string()};
    }

    std::vector<std::string> lines;
    std::string current;
    std::vector<char> buffer(Constants::READ_BUFFER_SIZE);
    while (gzgets(file, buffer.data(), static_cast<int>(buffer.size())) != Z_NULL) {
        current += buffer.data();
        if (!current.empty() && current.back() == '\n') {
            current.pop_back();
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(std::move(current));
            current.clear();
        }
    }

    int errnum = Z_OK;
    const char* message = gzerror(file, &errnum);
    std::string readError = (errnum != Z_OK) ? std::string(message ? message : "unknown zlib error") : "";
    int closeResult = gzclose(file);

    if (!readError.empty()) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string() + ": " + readError};
    }
    if (closeResult != Z_OK) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string() + ": truncated or corrupt gzip stream"};
    }

    if (!current.empty()) {
        if (current.back() == '\r') current.pop_back();
        lines.push_back(std::move(current));
    }
    return lines;
}

Expected<std::vector<Commit>> parseLines(const std::vector<std::string>& lines, size_t maxCount) {
    std::vector<Commit> commits;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (maxCount != 0 && commits.size() >= maxCount) break;
        if (isBlank(lines[i])) continue;
        auto commit = parseLine(lines[i], i + 1);
        if (!commit) return commit.error();
        commits.push_back(std::move(commit.value()));
    }
    return commits;
}

}

Expected<Commit> parseLine(const std::string& rawLine, size_t lineNumber) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < Constants::LOG_FIELD_COUNT) {
        return Error{ErrorCode::MalformedRecord,
                     "Line " + std::to_string(lineNumber) + ": expected " +
                     std::to_string(Constants::LOG_FIELD_COUNT) + " fields, found " +
                     std::to_string(fields.size())};
    }

    const size_t n = fields.size();
    Commit commit;
    commit.hash = trim(fields[0]);
    if (commit.hash.empty()) {
        return Error{ErrorCode::MalformedRecord, "Line " + std::to_string(lineNumber) + ": missing commit hash"};
    }
    commit.shortHash = trim(fields[1]);
    if (commit.shortHash.empty()) {
        commit.shortHash = commit.hash.substr(0, Constants::SHORT_HASH_LENGTH);
    }

    // Subject spans every field between the short hash and the author
    std::string message = fields[2];
    for (size_t i = 3; i < n - 4; ++i) {
        message += Constants::LOG_FIELD_SEPARATOR;
        message += fields[i];
    }
    commit.message = message;
    commit.author = fields[n - 4];
    commit.date = fields[n - 3];
    commit.parents = splitParents(fields[n - 2]);
    commit.refs = splitRefs(fields[n - 1]);
    commit.isMerge = commit.parents.size() > 1;
    commit.isLocal = true;
    return commit;
}

Expected<std::vector<Commit>> parse(std::istream& in, size_t maxCount) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read commit records from stream"};
    }
    return parseLines(lines, maxCount);
}

Expected<std::vector<Commit>> readFile(const fs::path& path, size_t maxCount) {
    auto lines = readLines(path);
    if (!lines) return lines.error();
    Logger::instance().debug("Read " + std::to_string(lines.value().size()) + " lines from " + path.string());
    return parseLines(lines.value(), maxCount);
}

Expected<std::unordered_set<std::string>> readHashSet(const fs::path& path) {
    auto lines = readLines(path);
    if (!lines) return lines.error();
    std::unordered_set<std::string> hashes;
    for (const auto& line : lines.value()) {
        std::string hash = trim(line);
        if (!hash.empty()) hashes.insert(hash);
    }
    return hashes;
}

void markLocalCommits(std::vector<Commit>& commits, const std::unordered_set<std::string>& remoteHashes) {
    for (auto& commit : commits) {
        commit.isLocal = remoteHashes.count(commit.hash) == 0;
    }
}

}  // namespace CommitLogReader

}  // namespace gitlanes
