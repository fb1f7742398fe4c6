// Simulated remote filesystem for running every operation without network.
#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace remotefs {

// In-memory tree shared by every MockRemoteClient created over it, so that a
// write through one session is visible to the next one.
class MockFileSystem {
public:
    struct Node {
        bool isDirectory = false;
        ByteBuffer data;
        std::int64_t modified = 0;
        std::uint32_t mode = 0644;
        bool dosListing = false;  // directories only: children listed IIS-style
    };

    MockFileSystem();

    // Seeded tree: /home, /var/log, /readme.txt and a DOS-style /legacy.
    static std::shared_ptr<MockFileSystem> withSampleTree();

    std::mutex& mutex() { return mtx_; }
    std::map<std::string, Node>& nodes() { return nodes_; }

private:
    std::mutex mtx_;
    std::map<std::string, Node> nodes_;  // normalized absolute path -> node
};

class MockRemoteClient : public RemoteClient {
public:
    explicit MockRemoteClient(std::shared_ptr<MockFileSystem> fs);

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

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
    std::shared_ptr<MockFileSystem> fs_;

    bool ensureConnected(std::string& err) const;
};

} // namespace remotefs
