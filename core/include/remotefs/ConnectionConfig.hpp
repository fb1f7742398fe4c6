// Connection settings for one RemoteFS invocation, layered from defaults,
// an access token, environment variables and command-line flags.
#pragma once
#include "RemoteTypes.hpp"
#include <functional>
#include <optional>
#include <string>

namespace remotefs {

enum class BackendKind {
    Sftp,  // libssh2 session
    Mock   // in-memory tree, no network
};

struct ConnectionConfig {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;
    std::optional<std::string> privateKeyPath;
    std::optional<std::string> privateKeyPassphrase;
    std::optional<std::string> knownHostsPath;
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Strict;
    std::string defaultPath = "/";
    int timeoutSeconds = 30;
    BackendKind backend = BackendKind::Sftp;

    SessionOptions toSessionOptions() const;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
EnvLookup processEnvironment();

// "1", "true", "yes" (any case) are true; other values false; unset -> def.
bool parseBool(const std::optional<std::string>& value, bool def);

bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out);
bool parseBackendKind(const std::string& text, BackendKind& out);
// Decimal digits only (surrounding whitespace allowed), 1..999999999.
bool parsePositiveInt(const std::string& text, int& out);
bool parsePort(const std::string& text, std::uint16_t& out);

// Access token: optional "Bearer " prefix, then base64 of either a JSON
// object (server/host, port, username, password, dir, timeoutSeconds,
// knownHosts, knownHostsPolicy, privateKey, privateKeyPassphrase; keys are
// case-insensitive) or "server:port:username:password:dir".
// Fields present in the token overwrite cfg.
bool applyAccessToken(const std::string& token, ConnectionConfig& cfg, std::string& err);

// REMOTEFS_TOKEN, then REMOTEFS_HOST/PORT/USER/PASSWORD/KEY/DIR/TIMEOUT/BACKEND.
bool applyEnvironment(const EnvLookup& env, ConnectionConfig& cfg, std::string& err);

// Host required for the SFTP backend; timeout clamped to at least one second.
bool validateConfig(ConnectionConfig& cfg, std::string& err);

} // namespace remotefs
