// Connection configuration: access tokens and environment overrides.
#include "remotefs/ConnectionConfig.hpp"
#include "remotefs/Base64.hpp"
#include "remotefs/PathNormalizer.hpp"
#include "remotefs/Log.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <vector>

namespace remotefs {

using nlohmann::json;

namespace {

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// JSON scalars arrive as numbers or strings depending on the token producer.
std::optional<std::string> scalarText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<unsigned long long>());
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_boolean()) return std::string(v.get<bool>() ? "true" : "false");
    return std::nullopt;
}

bool applyJsonToken(const json& doc, ConnectionConfig& cfg, std::string& err) {
    std::optional<std::string> server;
    std::optional<std::string> host;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string key = toLower(it.key());
        if (it.value().is_number_float()) {
            err = "Invalid number for " + it.key() + " in token: " + it.value().dump();
            return false;
        }
        const auto value = scalarText(it.value());
        if (!value) continue; // nulls and nested values are ignored
        if (key == "server") {
            server = value;
        } else if (key == "host") {
            host = value;
        } else if (key == "port") {
            if (!parsePort(*value, cfg.port)) {
                err = "Invalid port in token: " + *value;
                return false;
            }
        } else if (key == "username") {
            cfg.username = *value;
        } else if (key == "password") {
            cfg.password = *value;
        } else if (key == "dir") {
            if (!value->empty()) cfg.defaultPath = *value;
        } else if (key == "timeoutseconds") {
            int t = 0;
            if (parsePositiveInt(*value, t)) cfg.timeoutSeconds = t;
        } else if (key == "knownhosts") {
            cfg.knownHostsPath = *value;
        } else if (key == "knownhostspolicy") {
            if (!parseKnownHostsPolicy(*value, cfg.knownHostsPolicy)) {
                err = "Invalid knownHostsPolicy in token: " + *value;
                return false;
            }
        } else if (key == "privatekey") {
            cfg.privateKeyPath = *value;
        } else if (key == "privatekeypassphrase") {
            cfg.privateKeyPassphrase = *value;
        }
    }
    // "host" wins over "server" when both are given.
    if (host && !host->empty()) {
        cfg.host = *host;
    } else if (server && !server->empty()) {
        cfg.host = *server;
    }
    return true;
}

bool applyColonToken(const std::string& text, ConnectionConfig& cfg) {
    // server:port:username:password:dir, the last field keeps any further colons
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (parts.size() < 4) {
        auto colon = text.find(':', start);
        if (colon == std::string::npos) break;
        parts.push_back(text.substr(start, colon - start));
        start = colon + 1;
    }
    if (parts.size() < 4) return false;
    parts.push_back(text.substr(start));

    cfg.host = parts[0];
    std::uint16_t port = 0;
    if (parsePort(parts[1], port)) cfg.port = port;
    cfg.username = parts[2];
    cfg.password = parts[3];
    if (!parts[4].empty()) cfg.defaultPath = parts[4];
    return true;
}

} // namespace

SessionOptions ConnectionConfig::toSessionOptions() const {
    SessionOptions opt;
    opt.host = host;
    opt.port = port;
    opt.username = username;
    opt.password = password;
    opt.private_key_path = privateKeyPath;
    opt.private_key_passphrase = privateKeyPassphrase;
    opt.known_hosts_path = knownHostsPath;
    opt.known_hosts_policy = knownHostsPolicy;
    opt.timeout_seconds = timeoutSeconds;
    return opt;
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

bool parseBool(const std::optional<std::string>& value, bool def) {
    if (!value) return def;
    const std::string v = toLower(trim(*value));
    return v == "1" || v == "true" || v == "yes";
}

bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out) {
    const std::string v = toLower(trim(text));
    if (v == "strict") {
        out = KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew" || v == "tofu") {
        out = KnownHostsPolicy::AcceptNew;
    } else if (v == "off" || v == "none") {
        out = KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

bool parseBackendKind(const std::string& text, BackendKind& out) {
    const std::string v = toLower(trim(text));
    if (v == "sftp") {
        out = BackendKind::Sftp;
    } else if (v == "mock") {
        out = BackendKind::Mock;
    } else {
        return false;
    }
    return true;
}

bool parsePositiveInt(const std::string& text, int& out) {
    const std::string t = trim(text);
    if (t.empty() || t.size() > 9) return false;
    int v = 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    if (v <= 0) return false;
    out = v;
    return true;
}

bool parsePort(const std::string& text, std::uint16_t& out) {
    int v = 0;
    if (!parsePositiveInt(text, v) || v > 65535) return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

bool applyAccessToken(const std::string& token, ConnectionConfig& cfg, std::string& err) {
    std::string t = trim(token);
    if (t.size() >= 7 && toLower(t.substr(0, 7)) == "bearer ") t = trim(t.substr(7));
    if (t.empty()) {
        err = "Empty access token";
        return false;
    }

    ByteBuffer raw;
    if (!decodeBase64(t, raw)) {
        err = "Access token is not valid base64";
        return false;
    }
    const std::string text(raw.begin(), raw.end());

    json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!doc.is_discarded() && doc.is_object()) {
        LOGD("access token: JSON form");
        return applyJsonToken(doc, cfg, err);
    }
    if (applyColonToken(text, cfg)) {
        LOGD("access token: colon form");
        return true;
    }
    err = "Access token is neither a JSON object nor server:port:user:password:dir";
    return false;
}

bool applyEnvironment(const EnvLookup& env, ConnectionConfig& cfg, std::string& err) {
    if (auto token = env("REMOTEFS_TOKEN")) {
        if (!applyAccessToken(*token, cfg, err)) return false;
    }
    if (auto v = env("REMOTEFS_HOST")) cfg.host = *v;
    if (auto v = env("REMOTEFS_PORT")) {
        if (!parsePort(*v, cfg.port)) {
            err = "Invalid REMOTEFS_PORT: " + *v;
            return false;
        }
    }
    if (auto v = env("REMOTEFS_USER")) cfg.username = *v;
    if (auto v = env("REMOTEFS_PASSWORD")) cfg.password = *v;
    if (auto v = env("REMOTEFS_KEY")) cfg.privateKeyPath = *v;
    if (auto v = env("REMOTEFS_DIR")) {
        if (!v->empty()) cfg.defaultPath = *v;
    }
    if (auto v = env("REMOTEFS_TIMEOUT")) {
        int t = 0;
        if (!parsePositiveInt(*v, t)) {
            err = "Invalid REMOTEFS_TIMEOUT: " + *v;
            return false;
        }
        cfg.timeoutSeconds = t;
    }
    if (auto v = env("REMOTEFS_BACKEND")) {
        if (!parseBackendKind(*v, cfg.backend)) {
            err = "Invalid REMOTEFS_BACKEND: " + *v;
            return false;
        }
    }
    return true;
}

bool validateConfig(ConnectionConfig& cfg, std::string& err) {
    if (cfg.backend == BackendKind::Sftp && isBlank(cfg.host)) {
        err = "Host is required";
        return false;
    }
    if (cfg.port == 0) {
        err = "Port must be between 1 and 65535";
        return false;
    }
    if (cfg.timeoutSeconds < 1) cfg.timeoutSeconds = 1;
    if (isBlank(cfg.defaultPath)) cfg.defaultPath = "/";
    return true;
}

} // namespace remotefs
