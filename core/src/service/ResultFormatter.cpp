// JSON documents and URIs for listings, downloads, stat results and messages.
#include "remotefs/ResultFormatter.hpp"
#include "remotefs/Base64.hpp"
#include "remotefs/ListingDate.hpp"
#include "remotefs/MimeTypes.hpp"
#include "remotefs/PathNormalizer.hpp"

#include <cctype>
#include <cstdio>

namespace remotefs {

using nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

std::string percentEncode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned>(c));
            out += buf;
        }
    }
    return out;
}

std::string resourceUri(const std::string& path) {
    return "resource://remotefs/file?path=" + percentEncode(path);
}

std::string remoteUri(const std::string& host, std::uint16_t port, const std::string& path) {
    const std::string p = normalizePath(path);
    std::string escaped;
    std::size_t start = 0;
    while (start <= p.size()) {
        auto slash = p.find('/', start);
        if (slash == std::string::npos) slash = p.size();
        if (start > 0) escaped += '/';
        escaped += percentEncode(p.substr(start, slash - start));
        start = slash + 1;
    }
    return "sftp://" + host + ":" + std::to_string(port) + escaped;
}

json entryToJson(const DirectoryEntry& entry) {
    json j;
    j["name"] = entry.name;
    j["isDirectory"] = entry.isDirectory;
    j["size"] = optionalToJson(entry.size);
    j["modified"] = entry.modified ? json(formatUtcTimestamp(*entry.modified)) : json(nullptr);
    j["permissions"] = optionalToJson(entry.permissions);
    j["raw"] = entry.rawLine;
    return j;
}

json listingToJson(const std::string& host,
                   std::uint16_t port,
                   const std::string& path,
                   const std::vector<DirectoryEntry>& entries) {
    json items = json::array();
    for (const auto& e : entries) items.push_back(entryToJson(e));
    return json{{"host", host}, {"port", port}, {"path", path}, {"items", std::move(items)}};
}

json downloadToJson(const std::string& host,
                    std::uint16_t port,
                    const std::string& path,
                    const ByteBuffer& bytes,
                    const ClassificationResult& classification) {
    const std::string uri = resourceUri(path);
    const std::string mime = effectiveMimeType(path, classification.isText);

    json resource{{"uri", uri}, {"mimeType", mime}};
    if (classification.isText && classification.decodedText) {
        resource["text"] = *classification.decodedText;
    } else {
        resource["blob"] = encodeBase64(bytes);
    }

    json link{
        {"type", "resource_link"},
        {"uri", uri},
        {"name", baseName(path)},
        {"description", "Remote file " + path + " on " + host + ":" + std::to_string(port)},
        {"mimeType", mime},
        {"size", bytes.size()},
    };

    return json{
        {"path", path},
        {"size", bytes.size()},
        {"mimeType", mime},
        {"encoding", classification.encodingName},
        {"content", json::array({json{{"type", "resource"}, {"resource", std::move(resource)}},
                                 std::move(link)})},
    };
}

json statToJson(const std::string& path, const RemoteStat& st) {
    json j;
    j["path"] = path;
    j["isDirectory"] = st.isDirectory;
    j["size"] = optionalToJson(st.size);
    j["modified"] = st.modified ? json(formatUtcTimestamp(*st.modified)) : json(nullptr);
    if (st.mode) {
        char octal[16];
        std::snprintf(octal, sizeof(octal), "%04o", static_cast<unsigned>(*st.mode & 07777u));
        j["mode"] = octal;
    } else {
        j["mode"] = nullptr;
    }
    return j;
}

json messageToJson(const std::string& message) {
    return json{{"message", message}};
}

json errorToJson(const std::string& message) {
    return json{{"error", message}};
}

std::string renderJson(const json& doc) {
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace remotefs
