#include "core/ColorScheme.hpp"

#include <cstdlib>

namespace gitlanes {

namespace ColorScheme {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}

const std::vector<std::string>& palette() {
    static const std::vector<std::string> colors = {
        "#3b82f6",  // blue
        "#22c55e",  // green
        "#a855f7",  // purple
        "#ec4899",  // pink
        "#06b6d4",  // cyan
        "#f97316",  // orange
        "#6366f1",  // indigo
    };
    return colors;
}

const std::string& paletteColor(size_t index) {
    const auto& colors = palette();
    return colors[index % colors.size()];
}

std::string normalizeRefName(const std::string& ref) {
    std::string name = trim(ref);

    // Decorations are checked in the order git prints them
    if (startsWith(name, "HEAD -> ")) name = name.substr(8);
    if (startsWith(name, "tag: ")) name = name.substr(5);
    if (startsWith(name, "refs/heads/")) name = name.substr(11);
    else if (startsWith(name, "refs/remotes/")) name = name.substr(13);
    if (startsWith(name, "origin/")) name = name.substr(7);

    name = trim(name);
    if (name == "HEAD") return "";
    return name;
}

bool isMainBranch(const std::string& ref) {
    std::string name = normalizeRefName(ref);
    return name == "main" || name == "master";
}

int32_t hashBranchName(const std::string& name) {
    // Wraps at 32 bits; read back as two's complement
    uint32_t h = 0;
    for (unsigned char c : name) {
        h = h * 31u + c;
    }
    return static_cast<int32_t>(h);
}

const std::string& branchColor(const std::string& name) {
    // Widen before abs so INT32_MIN stays positive
    int64_t h = std::llabs(static_cast<int64_t>(hashBranchName(name)));
    return paletteColor(static_cast<size_t>(h));
}

}  // namespace ColorScheme

}  // namespace gitlanes
