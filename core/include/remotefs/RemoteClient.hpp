// Abstract interface for remote file-transfer sessions. Concrete backends
// (libssh2, mock) follow this API so the file service stays transport-agnostic.
#pragma once
#include "RemoteTypes.hpp"
#include <functional>
#include <memory>

namespace remotefs {

class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Raw directory listing text, one entry per line, exactly as the server sent it
    virtual bool listRaw(const std::string& remote_path,
                         std::string& listing,
                         std::string& err) = 0;

    // Whole-file transfers through memory
    virtual bool getBytes(const std::string& remote_path,
                          ByteBuffer& out,
                          std::string& err) = 0;

    // Create or truncate; missing parent directories are created first
    virtual bool putBytes(const std::string& remote_path,
                          const ByteBuffer& data,
                          std::string& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      RemoteStat& info,
                      std::string& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        bool overwrite = true) = 0;
};

// Builds a fresh, unconnected client for one operation.
using RemoteClientFactory = std::function<std::unique_ptr<RemoteClient>()>;

} // namespace remotefs
