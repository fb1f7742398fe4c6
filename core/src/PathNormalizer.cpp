// Remote path helpers used by every file-service operation.
#include "remotefs/PathNormalizer.hpp"
#include <algorithm>
#include <cctype>

namespace remotefs {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string normalizePath(const std::string& rawPath, const std::string& fallbackPath) {
    std::string p = isBlank(rawPath) ? fallbackPath : rawPath;
    if (isBlank(p)) p = "/";

    std::replace(p.begin(), p.end(), '\\', '/');
    if (p.front() != '/') p.insert(p.begin(), '/');
    return p;
}

std::string parentDirectory(const std::string& path) {
    std::string p = path.empty() ? std::string("/") : path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return p.substr(0, slash);
}

std::string siblingPath(const std::string& path, const std::string& newName) {
    std::string dir = parentDirectory(path);
    if (dir.back() != '/') dir += '/';
    std::size_t start = 0;
    while (start < newName.size() && newName[start] == '/') ++start;
    return dir + newName.substr(start);
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.find_last_of('/');
    std::string name = (slash == std::string::npos) ? p : p.substr(slash + 1);
    return name.empty() ? p : name;
}

} // namespace remotefs
