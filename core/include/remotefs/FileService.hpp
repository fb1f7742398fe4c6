// Remote file operations exposed to callers. Every operation normalizes its
// path against the configured default directory, opens a fresh session from
// the factory, runs one backend call and closes the session again.
#pragma once
#include "ConnectionConfig.hpp"
#include "RemoteClient.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace remotefs {

class FileService {
public:
    FileService(ConnectionConfig cfg, RemoteClientFactory factory);

    const ConnectionConfig& config() const { return cfg_; }

    // Resolved absolute path for a caller-supplied one.
    std::string remotePath(const std::string& path) const;

    bool listDirectory(const std::string& path, nlohmann::json& out, std::string& err);
    bool downloadFile(const std::string& path, nlohmann::json& out, std::string& err);
    bool uploadFile(const std::string& path, const std::string& dataBase64,
                    nlohmann::json& out, std::string& err);
    // Blank encoding means UTF-8 without BOM.
    bool writeFile(const std::string& path, const std::string& content, const std::string& encoding,
                   nlohmann::json& out, std::string& err);
    bool deleteFile(const std::string& path, nlohmann::json& out, std::string& err);
    bool makeDirectory(const std::string& path, nlohmann::json& out, std::string& err);
    bool removeDirectory(const std::string& path, nlohmann::json& out, std::string& err);
    // newName is a name in the same directory, not a full path.
    bool rename(const std::string& path, const std::string& newName, nlohmann::json& out, std::string& err);
    bool fileSize(const std::string& path, nlohmann::json& out, std::string& err);
    bool modifiedTime(const std::string& path, nlohmann::json& out, std::string& err);
    bool statPath(const std::string& path, nlohmann::json& out, std::string& err);

private:
    ConnectionConfig cfg_;
    RemoteClientFactory factory_;

    std::unique_ptr<RemoteClient> openSession(std::string& err);
    bool putContent(const std::string& remotePath, const ByteBuffer& bytes, std::string& err);
    bool statRemote(const std::string& remotePath, RemoteStat& st, std::string& err);
    std::string describe(const std::string& remotePath) const;
};

} // namespace remotefs
