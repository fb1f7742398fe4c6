// JSON shapes returned by the file service and printed by the CLI.
#pragma once
#include "ContentClassifier.hpp"
#include "RemoteTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace remotefs {

// RFC 3986 percent-encoding; only unreserved characters pass through.
std::string percentEncode(const std::string& s);

// "resource://remotefs/file?path=%2Fa%2Fb.txt"
std::string resourceUri(const std::string& path);

// "sftp://host:22/a/b%20c.txt" (segments encoded, slashes kept)
std::string remoteUri(const std::string& host, std::uint16_t port, const std::string& path);

// {name, isDirectory, size|null, modified|null, permissions|null, raw}
nlohmann::json entryToJson(const DirectoryEntry& entry);

nlohmann::json listingToJson(const std::string& host,
                             std::uint16_t port,
                             const std::string& path,
                             const std::vector<DirectoryEntry>& entries);

// Embedded resource (text or base64 blob) plus a resource link.
nlohmann::json downloadToJson(const std::string& host,
                              std::uint16_t port,
                              const std::string& path,
                              const ByteBuffer& bytes,
                              const ClassificationResult& classification);

nlohmann::json statToJson(const std::string& path, const RemoteStat& st);

nlohmann::json messageToJson(const std::string& message);
nlohmann::json errorToJson(const std::string& message);

// Pretty-printed; bytes that are not valid UTF-8 (raw listing lines from
// legacy servers) are replaced instead of throwing.
std::string renderJson(const nlohmann::json& doc);

} // namespace remotefs
