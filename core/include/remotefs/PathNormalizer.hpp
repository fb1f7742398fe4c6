// Canonical remote paths: forward slashes, rooted, with a default fallback.
#pragma once
#include <string>

namespace remotefs {

// Blank rawPath falls back to fallbackPath, then to "/". Backslashes become
// slashes and the result is always rooted. ".." segments are kept as-is.
std::string normalizePath(const std::string& rawPath,
                          const std::string& fallbackPath = std::string());

// "/a/b/c.txt" -> "/a/b"; "/c.txt" and "/" -> "/".
std::string parentDirectory(const std::string& path);

// Same directory as path, new last segment: ("/a/b.txt", "c.txt") -> "/a/c.txt".
std::string siblingPath(const std::string& path, const std::string& newName);

// Last segment ("/a/b.txt" -> "b.txt"), ignoring a trailing slash.
std::string baseName(const std::string& path);

bool isBlank(const std::string& s);

} // namespace remotefs
