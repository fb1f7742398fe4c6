// Mock implementation: an in-memory tree rendered as raw listing text.
#include "remotefs/MockRemoteClient.hpp"
#include "remotefs/ListingDate.hpp"
#include "remotefs/PathNormalizer.hpp"
#include "remotefs/Log.hpp"

#include <cstdio>
#include <ctime>

namespace remotefs {

namespace {

// Fixed clock for seeded entries: 2023-11-14 22:13:20 UTC.
constexpr std::int64_t kSeedTime = 1700000000;

std::string keyFor(const std::string& path) {
    std::string p = normalizePath(path);
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

std::vector<std::string> childrenOf(const std::map<std::string, MockFileSystem::Node>& nodes,
                                    const std::string& dir) {
    std::vector<std::string> out;
    for (const auto& kv : nodes) {
        if (kv.first != "/" && parentDirectory(kv.first) == dir) out.push_back(kv.first);
    }
    return out;
}

std::string permissionString(const MockFileSystem::Node& n) {
    std::string s = n.isDirectory ? "d" : "-";
    static const char kBits[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) s += (n.mode & (0400u >> i)) ? kBits[i] : '-';
    return s;
}

// "drwxr-xr-x 1 owner group 4096 Nov 14 22:13 name", with the year instead
// of the time of day for entries outside the current year, as ls does.
std::string unixLine(const std::string& name, const MockFileSystem::Node& n) {
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::time_t t = static_cast<std::time_t>(n.modified);
    std::tm tm{};
    gmtime_r(&t, &tm);
    const unsigned long long size = n.isDirectory ? 4096ULL : n.data.size();
    char stamp[32];
    if (tm.tm_year + 1900 == currentUtcYear()) {
        std::snprintf(stamp, sizeof(stamp), "%s %2d %02d:%02d",
                      kMonths[tm.tm_mon], tm.tm_mday, tm.tm_hour, tm.tm_min);
    } else {
        std::snprintf(stamp, sizeof(stamp), "%s %2d  %04d",
                      kMonths[tm.tm_mon], tm.tm_mday, tm.tm_year + 1900);
    }
    char head[96];
    std::snprintf(head, sizeof(head), "%s 1 owner group %10llu %s ",
                  permissionString(n).c_str(), size, stamp);
    return head + name;
}

// "11-14-23  10:13PM       <DIR>          name"
std::string dosLine(const std::string& name, const MockFileSystem::Node& n) {
    std::time_t t = static_cast<std::time_t>(n.modified);
    std::tm tm{};
    gmtime_r(&t, &tm);
    int hour12 = tm.tm_hour % 12;
    if (hour12 == 0) hour12 = 12;
    char head[96];
    if (n.isDirectory) {
        std::snprintf(head, sizeof(head), "%02d-%02d-%02d  %02d:%02d%s       <DIR>          ",
                      tm.tm_mon + 1, tm.tm_mday, tm.tm_year % 100, hour12, tm.tm_min,
                      tm.tm_hour < 12 ? "AM" : "PM");
    } else {
        std::snprintf(head, sizeof(head), "%02d-%02d-%02d  %02d:%02d%s %20llu ",
                      tm.tm_mon + 1, tm.tm_mday, tm.tm_year % 100, hour12, tm.tm_min,
                      tm.tm_hour < 12 ? "AM" : "PM",
                      static_cast<unsigned long long>(n.data.size()));
    }
    return head + name;
}

ByteBuffer bytesOf(const std::string& s) {
    return ByteBuffer(s.begin(), s.end());
}

} // namespace

MockFileSystem::MockFileSystem() {
    Node root;
    root.isDirectory = true;
    root.mode = 0755;
    root.modified = kSeedTime;
    nodes_["/"] = root;
}

std::shared_ptr<MockFileSystem> MockFileSystem::withSampleTree() {
    auto fs = std::make_shared<MockFileSystem>();
    auto& n = fs->nodes();

    auto dir = [&](const std::string& path, bool dos = false) {
        Node d;
        d.isDirectory = true;
        d.mode = 0755;
        d.modified = kSeedTime;
        d.dosListing = dos;
        n[path] = d;
    };
    auto file = [&](const std::string& path, const ByteBuffer& data) {
        Node f;
        f.data = data;
        f.modified = kSeedTime;
        n[path] = f;
    };

    dir("/home");
    dir("/home/guest");
    dir("/var");
    dir("/var/log");
    dir("/legacy", true);
    dir("/legacy/archive");
    file("/readme.txt", bytesOf("Welcome to the RemoteFS mock server.\n"));
    file("/home/notes.md", bytesOf("# Notes\n\n- first\n- second\n"));
    file("/var/log/app.log", bytesOf("started\nready\n"));
    file("/legacy/report.txt", bytesOf("quarterly report\r\n"));
    // PNG signature followed by the start of an IHDR chunk.
    file("/home/guest/pixel.png", ByteBuffer{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                                             0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52});
    return fs;
}

MockRemoteClient::MockRemoteClient(std::shared_ptr<MockFileSystem> fs)
    : fs_(std::move(fs)) {}

bool MockRemoteClient::connect(const SessionOptions& opt, std::string& err) {
    if (!fs_) {
        err = "Mock filesystem not available";
        return false;
    }
    LOGD("mock connect %s:%u", opt.host.c_str(), static_cast<unsigned>(opt.port));
    connected_ = true;
    return true;
}

void MockRemoteClient::disconnect() {
    connected_ = false;
}

bool MockRemoteClient::ensureConnected(std::string& err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MockRemoteClient::listRaw(const std::string& remote_path,
                               std::string& listing,
                               std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    const auto& nodes = fs_->nodes();
    const std::string key = keyFor(remote_path);
    auto it = nodes.find(key);
    if (it == nodes.end()) {
        err = "Remote path not found: " + key;
        return false;
    }
    if (!it->second.isDirectory) {
        err = "Not a directory: " + key;
        return false;
    }

    listing.clear();
    for (const auto& child : childrenOf(nodes, key)) {
        const auto& node = nodes.at(child);
        const std::string name = baseName(child);
        listing += it->second.dosListing ? dosLine(name, node) : unixLine(name, node);
        listing += "\r\n";
    }
    return true;
}

bool MockRemoteClient::getBytes(const std::string& remote_path,
                                ByteBuffer& out,
                                std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    const std::string key = keyFor(remote_path);
    auto it = fs_->nodes().find(key);
    if (it == fs_->nodes().end()) {
        err = "Remote file not found: " + key;
        return false;
    }
    if (it->second.isDirectory) {
        err = "Is a directory: " + key;
        return false;
    }
    out = it->second.data;
    return true;
}

bool MockRemoteClient::putBytes(const std::string& remote_path,
                                const ByteBuffer& data,
                                std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    auto& nodes = fs_->nodes();
    const std::string key = keyFor(remote_path);
    if (key == "/") {
        err = "Cannot write to the root directory";
        return false;
    }
    auto existing = nodes.find(key);
    if (existing != nodes.end() && existing->second.isDirectory) {
        err = "Is a directory: " + key;
        return false;
    }

    const std::int64_t now = static_cast<std::int64_t>(std::time(nullptr));
    // mkdir -p for the parents
    std::vector<std::string> missing;
    for (std::string dir = parentDirectory(key); dir != "/"; dir = parentDirectory(dir)) {
        auto d = nodes.find(dir);
        if (d == nodes.end()) {
            missing.push_back(dir);
        } else if (!d->second.isDirectory) {
            err = "Parent is not a directory: " + dir;
            return false;
        }
    }
    for (const auto& dir : missing) {
        MockFileSystem::Node d;
        d.isDirectory = true;
        d.mode = 0755;
        d.modified = now;
        nodes[dir] = d;
    }

    MockFileSystem::Node& f = nodes[key];
    f.isDirectory = false;
    f.data = data;
    f.modified = now;
    return true;
}

bool MockRemoteClient::stat(const std::string& remote_path,
                            RemoteStat& info,
                            std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    const std::string key = keyFor(remote_path);
    auto it = fs_->nodes().find(key);
    if (it == fs_->nodes().end()) {
        err = "Remote path not found: " + key;
        return false;
    }
    const auto& n = it->second;
    info = RemoteStat{};
    info.isDirectory = n.isDirectory;
    info.size = n.isDirectory ? 0 : static_cast<std::uint64_t>(n.data.size());
    info.modified = n.modified;
    info.mode = (n.isDirectory ? 0040000u : 0100000u) | n.mode;
    return true;
}

bool MockRemoteClient::mkdir(const std::string& remote_dir,
                             std::string& err,
                             unsigned int mode) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    auto& nodes = fs_->nodes();
    const std::string key = keyFor(remote_dir);
    if (nodes.count(key)) {
        err = "Already exists: " + key;
        return false;
    }
    auto parent = nodes.find(parentDirectory(key));
    if (parent == nodes.end() || !parent->second.isDirectory) {
        err = "Parent directory not found: " + parentDirectory(key);
        return false;
    }
    MockFileSystem::Node d;
    d.isDirectory = true;
    d.mode = mode & 0777u;
    d.modified = static_cast<std::int64_t>(std::time(nullptr));
    nodes[key] = d;
    return true;
}

bool MockRemoteClient::removeFile(const std::string& remote_path,
                                  std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    auto& nodes = fs_->nodes();
    const std::string key = keyFor(remote_path);
    auto it = nodes.find(key);
    if (it == nodes.end()) {
        err = "Remote file not found: " + key;
        return false;
    }
    if (it->second.isDirectory) {
        err = "Is a directory: " + key;
        return false;
    }
    nodes.erase(it);
    return true;
}

bool MockRemoteClient::removeDir(const std::string& remote_dir,
                                 std::string& err) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    auto& nodes = fs_->nodes();
    const std::string key = keyFor(remote_dir);
    if (key == "/") {
        err = "Cannot remove the root directory";
        return false;
    }
    auto it = nodes.find(key);
    if (it == nodes.end() || !it->second.isDirectory) {
        err = "Remote directory not found: " + key;
        return false;
    }
    if (!childrenOf(nodes, key).empty()) {
        err = "Directory not empty: " + key;
        return false;
    }
    nodes.erase(it);
    return true;
}

bool MockRemoteClient::rename(const std::string& from,
                              const std::string& to,
                              std::string& err,
                              bool overwrite) {
    if (!ensureConnected(err)) return false;
    std::lock_guard<std::mutex> lk(fs_->mutex());
    auto& nodes = fs_->nodes();
    const std::string src = keyFor(from);
    const std::string dst = keyFor(to);
    auto it = nodes.find(src);
    if (it == nodes.end() || src == "/") {
        err = "Remote path not found: " + src;
        return false;
    }
    if (src == dst) return true;
    if (dst.compare(0, src.size() + 1, src + "/") == 0) {
        err = "Cannot move a directory into itself";
        return false;
    }
    auto target = nodes.find(dst);
    if (target != nodes.end()) {
        if (!overwrite) {
            err = "Destination exists: " + dst;
            return false;
        }
        if (target->second.isDirectory) {
            err = "Destination is a directory: " + dst;
            return false;
        }
    }
    auto parent = nodes.find(parentDirectory(dst));
    if (parent == nodes.end() || !parent->second.isDirectory) {
        err = "Parent directory not found: " + parentDirectory(dst);
        return false;
    }

    // Move the node and, for directories, everything below it.
    std::map<std::string, MockFileSystem::Node> moved;
    const std::string prefix = src + "/";
    for (auto n = nodes.begin(); n != nodes.end();) {
        if (n->first == src) {
            moved[dst] = n->second;
            n = nodes.erase(n);
        } else if (n->first.compare(0, prefix.size(), prefix) == 0) {
            moved[dst + n->first.substr(src.size())] = n->second;
            n = nodes.erase(n);
        } else {
            ++n;
        }
    }
    for (auto& kv : moved) nodes[kv.first] = std::move(kv.second);
    return true;
}

} // namespace remotefs
