// File-extension based MIME lookup for downloaded files.
#pragma once
#include <string>

namespace remotefs {

constexpr const char* kGenericBinaryMime = "application/octet-stream";
constexpr const char* kPlainTextMime = "text/plain";

// Case-insensitive lookup on the last extension; unknown -> application/octet-stream.
std::string mimeTypeForPath(const std::string& path);

// Content that classified as text is never labelled with the generic binary type.
std::string effectiveMimeType(const std::string& path, bool isText);

} // namespace remotefs
