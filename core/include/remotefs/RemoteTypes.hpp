// Basic types shared between the core, the transport backends and the CLI.
// Plain structures so that formatting and tests can build them directly.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace remotefs {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// One line of a directory listing after dialect parsing.
struct DirectoryEntry {
    std::string                  name;
    bool                         isDirectory = false;
    std::optional<std::uint64_t> size;
    std::optional<std::int64_t>  modified;     // epoch seconds, listing wall clock read as UTC
    std::optional<std::string>   permissions;  // verbatim, e.g. "drwxr-xr-x"
    std::string                  rawLine;      // always the unmodified source line

    bool operator==(const DirectoryEntry& o) const {
        return name == o.name && isDirectory == o.isDirectory && size == o.size &&
               modified == o.modified && permissions == o.permissions && rawLine == o.rawLine;
    }
    bool operator!=(const DirectoryEntry& o) const { return !(*this == o); }
};

// Metadata of a single remote path as reported by the transport.
struct RemoteStat {
    bool                         isDirectory = false;
    std::optional<std::uint64_t> size;
    std::optional<std::int64_t>  modified;  // epoch seconds
    std::optional<std::uint32_t> mode;      // POSIX bits (permissions/type)
};

// Transport-level session settings handed to a RemoteClient.
struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    int timeout_seconds = 30;
};

using ByteBuffer = std::vector<unsigned char>;

} // namespace remotefs
