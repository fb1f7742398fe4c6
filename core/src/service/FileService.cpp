// File operations: one session per call, results shaped as JSON documents.
#include "remotefs/FileService.hpp"
#include "remotefs/Base64.hpp"
#include "remotefs/ContentClassifier.hpp"
#include "remotefs/ListingDate.hpp"
#include "remotefs/ListingParser.hpp"
#include "remotefs/Log.hpp"
#include "remotefs/PathNormalizer.hpp"
#include "remotefs/ResultFormatter.hpp"
#include "remotefs/TextEncoding.hpp"

namespace remotefs {

using nlohmann::json;

FileService::FileService(ConnectionConfig cfg, RemoteClientFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)) {}

std::string FileService::remotePath(const std::string& path) const {
    return normalizePath(path, cfg_.defaultPath);
}

std::string FileService::describe(const std::string& remotePath) const {
    return remoteUri(cfg_.host, cfg_.port, remotePath);
}

std::unique_ptr<RemoteClient> FileService::openSession(std::string& err) {
    if (!factory_) {
        err = "No transport backend configured";
        return nullptr;
    }
    auto client = factory_();
    if (!client) {
        err = "Could not create a transport session";
        return nullptr;
    }
    if (!client->connect(cfg_.toSessionOptions(), err)) {
        LOGE("connect to %s:%u failed: %s", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port), err.c_str());
        return nullptr;
    }
    return client;
}

bool FileService::statRemote(const std::string& remotePath, RemoteStat& st, std::string& err) {
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->stat(remotePath, st, err);
    client->disconnect();
    if (!ok) LOGE("stat %s failed: %s", remotePath.c_str(), err.c_str());
    return ok;
}

bool FileService::putContent(const std::string& remotePath, const ByteBuffer& bytes, std::string& err) {
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->putBytes(remotePath, bytes, err);
    client->disconnect();
    if (!ok) LOGE("upload to %s failed: %s", remotePath.c_str(), err.c_str());
    return ok;
}

bool FileService::listDirectory(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    LOGI("listing %s on %s:%u", rp.c_str(), cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));

    auto client = openSession(err);
    if (!client) return false;
    std::string text;
    const bool ok = client->listRaw(rp, text, err);
    client->disconnect();
    if (!ok) {
        LOGE("list %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }

    const auto entries = parseListing(text);
    LOGI("returning %zu items for %s", entries.size(), rp.c_str());
    out = listingToJson(cfg_.host, cfg_.port, rp, entries);
    return true;
}

bool FileService::downloadFile(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    LOGI("downloading %s from %s:%u", rp.c_str(), cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));

    auto client = openSession(err);
    if (!client) return false;
    ByteBuffer bytes;
    const bool ok = client->getBytes(rp, bytes, err);
    client->disconnect();
    if (!ok) {
        LOGE("download %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }

    const ClassificationResult cls = classifyContent(bytes);
    LOGD("%s: %zu bytes, %s (confidence %.2f)", rp.c_str(), bytes.size(),
         cls.encodingName.c_str(), cls.confidence);
    out = downloadToJson(cfg_.host, cfg_.port, rp, bytes, cls);
    return true;
}

bool FileService::uploadFile(const std::string& path, const std::string& dataBase64,
                             json& out, std::string& err) {
    ByteBuffer bytes;
    if (!decodeBase64(dataBase64, bytes)) {
        err = "Upload data is not valid base64";
        return false;
    }
    const std::string rp = remotePath(path);
    LOGI("uploading %zu bytes to %s", bytes.size(), rp.c_str());
    if (!putContent(rp, bytes, err)) return false;

    const std::string uri = describe(rp);
    out = messageToJson("Uploaded " + std::to_string(bytes.size()) + " bytes to " + uri);
    out["bytes"] = bytes.size();
    out["uri"] = uri;
    return true;
}

bool FileService::writeFile(const std::string& path, const std::string& content, const std::string& encoding,
                            json& out, std::string& err) {
    ByteBuffer bytes;
    std::string used;
    if (!encodeText(content, encoding, bytes, used, err)) return false;

    const std::string rp = remotePath(path);
    LOGI("writing %zu bytes (%s) to %s", bytes.size(), used.c_str(), rp.c_str());
    if (!putContent(rp, bytes, err)) return false;

    const std::string uri = describe(rp);
    out = messageToJson("Wrote " + std::to_string(bytes.size()) + " bytes to " + uri +
                        " using " + used + " encoding");
    out["bytes"] = bytes.size();
    out["uri"] = uri;
    out["encoding"] = used;
    return true;
}

bool FileService::deleteFile(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    LOGI("deleting %s", rp.c_str());
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->removeFile(rp, err);
    client->disconnect();
    if (!ok) {
        LOGE("delete %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }
    out = messageToJson("Deleted " + describe(rp));
    return true;
}

bool FileService::makeDirectory(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    LOGI("creating directory %s", rp.c_str());
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->mkdir(rp, err);
    client->disconnect();
    if (!ok) {
        LOGE("mkdir %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }
    out = messageToJson("Created directory " + describe(rp));
    return true;
}

bool FileService::removeDirectory(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    LOGI("removing directory %s", rp.c_str());
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->removeDir(rp, err);
    client->disconnect();
    if (!ok) {
        LOGE("rmdir %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }
    out = messageToJson("Removed directory " + describe(rp));
    return true;
}

bool FileService::rename(const std::string& path, const std::string& newName, json& out, std::string& err) {
    if (isBlank(newName)) {
        err = "New name is required";
        return false;
    }
    const std::string rp = remotePath(path);
    const std::string dest = siblingPath(rp, newName);
    LOGI("renaming %s to %s", rp.c_str(), dest.c_str());
    auto client = openSession(err);
    if (!client) return false;
    const bool ok = client->rename(rp, dest, err);
    client->disconnect();
    if (!ok) {
        LOGE("rename %s failed: %s", rp.c_str(), err.c_str());
        return false;
    }
    out = messageToJson("Renamed " + describe(rp) + " to " + newName);
    out["path"] = dest;
    return true;
}

bool FileService::fileSize(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    RemoteStat st;
    if (!statRemote(rp, st, err)) return false;
    if (st.isDirectory) {
        err = "Not a file: " + rp;
        return false;
    }
    if (!st.size) {
        err = "Server did not report a size for " + rp;
        return false;
    }
    out = json{{"path", rp}, {"size", *st.size}};
    return true;
}

bool FileService::modifiedTime(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    RemoteStat st;
    if (!statRemote(rp, st, err)) return false;
    if (!st.modified) {
        err = "Server did not report a modification time for " + rp;
        return false;
    }
    out = json{{"path", rp}, {"modified", formatUtcTimestamp(*st.modified)}};
    return true;
}

bool FileService::statPath(const std::string& path, json& out, std::string& err) {
    const std::string rp = remotePath(path);
    RemoteStat st;
    if (!statRemote(rp, st, err)) return false;
    out = statToJson(rp, st);
    return true;
}

} // namespace remotefs
