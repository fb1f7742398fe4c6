// RemoteClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "RemoteClient.hpp"
#include <string>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace remotefs {

class Libssh2RemoteClient : public RemoteClient {
public:
    Libssh2RemoteClient();
    ~Libssh2RemoteClient() override;

    Libssh2RemoteClient(const Libssh2RemoteClient&) = delete;
    Libssh2RemoteClient& operator=(const Libssh2RemoteClient&) = delete;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    // Built from the server's long names (ls -l lines) of each entry.
    bool listRaw(const std::string& remote_path,
                 std::string& listing,
                 std::string& err) override;

    bool getBytes(const std::string& remote_path,
                  ByteBuffer& out,
                  std::string& err) override;

    bool putBytes(const std::string& remote_path,
                  const ByteBuffer& data,
                  std::string& err) override;

    bool stat(const std::string& remote_path,
              RemoteStat& info,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err,
                bool overwrite = true) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    // TCP connection + SSH handshake, host key check and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
    bool sshHandshake(const SessionOptions& opt, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    bool authenticateWithAgent(const std::string& username);
    bool ensureParentDirs(const std::string& remote_path, std::string& err);
    std::string lastSessionError() const;
};

} // namespace remotefs
