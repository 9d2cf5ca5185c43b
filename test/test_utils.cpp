#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

#include <zlib.h>

namespace fs = std::filesystem;

namespace gitlanes::test::utils {

Commit makeCommit(
    const std::string& hash,
    const std::vector<std::string>& parents,
    const std::vector<std::string>& refs
) {
    Commit commit;
    commit.hash = hash;
    commit.shortHash = hash.substr(0, 7);
    commit.message = "Commit " + hash;
    commit.author = "Author";
    commit.date = "2 hours ago";
    commit.parents = parents;
    commit.refs = refs;
    commit.isMerge = parents.size() > 1;
    return commit;
}

std::string toLogLine(const Commit& commit) {
    std::string parents;
    for (const auto& p : commit.parents) {
        if (!parents.empty()) parents += ' ';
        parents += p;
    }
    std::string refs;
    for (const auto& r : commit.refs) {
        if (!refs.empty()) refs += ", ";
        refs += r;
    }
    return commit.hash + "|" + commit.shortHash + "|" + commit.message + "|" +
           commit.author + "|" + commit.date + "|" + parents + "|" + refs;
}

std::string toLog(const std::vector<Commit>& commits) {
    std::string log;
    for (const auto& commit : commits) {
        log += toLogLine(commit);
        log += '\n';
    }
    return log;
}

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    
    std::string dirname = "gitlanes_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }
    
    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    if (fs::exists(dir)) {
        fs::remove_all(dir);
    }
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;
    fs::create_directories(filePath.parent_path());
    
    std::ofstream file(filePath, std::ios::binary);
    file << content;
    file.close();
    
    return filePath;
}

fs::path createGzipFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;
    fs::create_directories(filePath.parent_path());

    gzFile file = gzopen(filePath.string().c_str(), "wb");
    if (!file) {
        throw std::runtime_error("gzopen failed for " + filePath.string());
    }
    int written = gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
    int closed = gzclose(file);
    if ((written == 0 && !content.empty()) || closed != Z_OK) {
        throw std::runtime_error("gzip write failed for " + filePath.string());
    }
    return filePath;
}

} // namespace gitlanes::test::utils
