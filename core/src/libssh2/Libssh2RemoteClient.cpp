// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation and whole-file transfers.
#include "remotefs/Libssh2RemoteClient.hpp"
#include "remotefs/PathNormalizer.hpp"
#include "remotefs/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <thread>
#include <vector>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace remotefs {

namespace {

// Global libssh2 initialization (once per process)
std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

struct KbdIntCtx {
    const char* user;
    const char* pass;
};

char* dupResponse(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Keyboard-interactive: prompts mentioning "user"/"name" get the username,
// everything else the password.
void kbintCallback(const char* name, int name_len,
                   const char* instruction, int instruction_len,
                   int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                   void** abstract) {
    (void)name; (void)name_len; (void)instruction; (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text) {
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        }
        for (auto& c : prompt) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

int knownHostAlgorithm(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

bool isDirectoryAttr(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    return (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
           (a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
}

// ls -l style line for servers that send an empty long name.
std::string synthesizeLongEntry(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& a) {
    static const char kBits[] = "rwxrwxrwx";
    std::string perms = isDirectoryAttr(a) ? "d" : "-";
    for (int i = 0; i < 9; ++i) {
        const bool set = (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && (a.permissions & (0400u >> i));
        perms += set ? kBits[i] : '-';
    }
    char stamp[32] = "Jan  1  1970";
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        std::time_t t = static_cast<std::time_t>(a.mtime);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::strftime(stamp, sizeof(stamp), "%b %d  %Y", &tm);
    }
    const unsigned long long size = (a.flags & LIBSSH2_SFTP_ATTR_SIZE) ? a.filesize : 0ULL;
    char head[96];
    std::snprintf(head, sizeof(head), "%s 1 %lu %lu %llu %s ", perms.c_str(),
                  (a.flags & LIBSSH2_SFTP_ATTR_UIDGID) ? a.uid : 0UL,
                  (a.flags & LIBSSH2_SFTP_ATTR_UIDGID) ? a.gid : 0UL,
                  size, stamp);
    return head + name;
}

} // namespace

Libssh2RemoteClient::Libssh2RemoteClient() {
    std::call_once(g_libssh2_once, [] { g_libssh2_init_rc = libssh2_init(0); });
}

Libssh2RemoteClient::~Libssh2RemoteClient() {
    disconnect();
}

std::string Libssh2RemoteClient::lastSessionError() const {
    if (!session_) return std::string();
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
}

bool Libssh2RemoteClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive; read/write timeouts are left to libssh2.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2RemoteClient::sshHandshake(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(opt.timeout_seconds) * 1000L);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);
    return true;
}

bool Libssh2RemoteClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) {
        LOGW("host key verification disabled for %s", opt.host.c_str());
        return true;
    }

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }

    const int alg = knownHostAlgorithm(keytype);
    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU without a prompt: record the key and go on.
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        const bool written = addrc == 0 &&
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!written) {
            err = "Could not add host to known_hosts";
            return false;
        }
        LOGI("added %s to %s", opt.host.c_str(), khPath.c_str());
        return true;
    }

    libssh2_knownhost_free(nh);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key does not match known_hosts";
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "Host not found in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2RemoteClient::authenticateWithAgent(const std::string& username) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, username.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (arc == 0) {
                authed = true;
                break;
            }
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

bool Libssh2RemoteClient::authenticate(const SessionOptions& opt, std::string& err) {
    // 1) private key, 2) password then keyboard-interactive, 3) ssh-agent.
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err = "Public key authentication failed: " + lastSessionError();
            return false;
        }
        return true;
    }

    auto authMethods = [&]() {
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              static_cast<unsigned>(opt.username.size()));
        return methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        int rc = 0;
        for (;;) {
            rc = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
            if (rc != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc == 0) return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }

        const std::string methods = authMethods();
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            for (;;) {
                rc = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbintCallback);
                if (rc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rc == 0) return true;
        }
        if (methods.find("publickey") != std::string::npos && authenticateWithAgent(opt.username)) {
            return true;
        }
        err = "Password authentication failed";
        if (!methods.empty()) err += " (methods: " + methods + ")";
        const std::string last = lastSessionError();
        if (!last.empty()) err += ": " + last;
        return false;
    }

    const std::string methods = authMethods();
    if (methods.find("publickey") != std::string::npos && authenticateWithAgent(opt.username)) {
        return true;
    }
    err = "No credentials: no key, agent identity or password available";
    return false;
}

bool Libssh2RemoteClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (g_libssh2_init_rc != 0) {
        err = "libssh2_init failed";
        return false;
    }
    // Partial state is released by disconnect() on any failure below.
    if (!tcpConnect(opt.host, opt.port, err) ||
        !sshHandshake(opt, err) ||
        !verifyHostKey(opt, err) ||
        !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP: " + lastSessionError();
        disconnect();
        return false;
    }

    connected_ = true;
    LOGI("connected to %s:%u as %s", opt.host.c_str(), static_cast<unsigned>(opt.port), opt.username.c_str());
    return true;
}

void Libssh2RemoteClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2RemoteClient::listRaw(const std::string& remote_path,
                                  std::string& listing,
                                  std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        return false;
    }

    listing.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            const std::string name(filename, static_cast<std::size_t>(rc));
            if (name == "." || name == "..") continue;
            const std::size_t longLen = strnlen(longentry, sizeof(longentry));
            listing += longLen > 0 ? std::string(longentry, longLen) : synthesizeLongEntry(name, attrs);
            listing += '\n';
        } else if (rc == 0) {
            break;
        } else {
            err = "sftp_readdir_ex failed for: " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2RemoteClient::getBytes(const std::string& remote_path,
                                   ByteBuffer& out,
                                   std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading: " + remote_path;
        return false;
    }

    out.clear();
    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            out.insert(out.end(), buf.data(), buf.data() + n);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = "Remote read failed: " + remote_path;
            libssh2_sftp_close(rh);
            return false;
        }
    }

    libssh2_sftp_close(rh);
    return true;
}

bool Libssh2RemoteClient::ensureParentDirs(const std::string& remote_path, std::string& err) {
    std::vector<std::string> missing;
    for (std::string dir = parentDirectory(remote_path); dir != "/"; dir = parentDirectory(dir)) {
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_stat_ex(sftp_, dir.c_str(), static_cast<unsigned>(dir.size()),
                                 LIBSSH2_SFTP_STAT, &st) == 0) {
            break;
        }
        missing.push_back(dir);
    }
    // Outermost first
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        if (libssh2_sftp_mkdir(sftp_, it->c_str(), 0755) != 0) {
            err = "Could not create remote directory: " + *it;
            return false;
        }
        LOGD("created remote directory %s", it->c_str());
    }
    return true;
}

bool Libssh2RemoteClient::putBytes(const std::string& remote_path,
                                   const ByteBuffer& data,
                                   std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (!ensureParentDirs(remote_path, err)) return false;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "Could not open remote file for writing: " + remote_path;
        return false;
    }

    const char* p = reinterpret_cast<const char*>(data.data());
    std::size_t remain = data.size();
    while (remain > 0) {
        ssize_t w = libssh2_sftp_write(wh, p, remain);
        if (w < 0) {
            err = "Remote write failed: " + remote_path;
            libssh2_sftp_close(wh);
            return false;
        }
        remain -= static_cast<std::size_t>(w);
        p += w;
    }

    libssh2_sftp_close(wh);
    return true;
}

bool Libssh2RemoteClient::stat(const std::string& remote_path,
                               RemoteStat& info,
                               std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        err = (sftp_err == LIBSSH2_FX_NO_SUCH_FILE) ? "Remote path not found: " + remote_path
                                                    : "Remote stat failed: " + remote_path;
        return false;
    }
    info = RemoteStat{};
    info.isDirectory = isDirectoryAttr(st);
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = static_cast<std::uint64_t>(st.filesize);
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.modified = static_cast<std::int64_t>(st.mtime);
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) info.mode = static_cast<std::uint32_t>(st.permissions);
    return true;
}

bool Libssh2RemoteClient::mkdir(const std::string& remote_dir,
                                std::string& err,
                                unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = "sftp_mkdir failed: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2RemoteClient::removeFile(const std::string& remote_path,
                                     std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = "sftp_unlink failed: " + remote_path;
        return false;
    }
    return true;
}

bool Libssh2RemoteClient::removeDir(const std::string& remote_dir,
                                    std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = "sftp_rmdir failed (directory not empty?): " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2RemoteClient::rename(const std::string& from,
                                 const std::string& to,
                                 std::string& err,
                                 bool overwrite) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(sftp_,
                                    from.c_str(), static_cast<unsigned>(from.size()),
                                    to.c_str(), static_cast<unsigned>(to.size()),
                                    flags);
    if (rc != 0 && overwrite) {
        // SFTPv3 servers ignore the flags and refuse to replace an existing file.
        LIBSSH2_SFTP_ATTRIBUTES st{};
        const bool targetExists = libssh2_sftp_stat_ex(sftp_, to.c_str(), static_cast<unsigned>(to.size()),
                                                       LIBSSH2_SFTP_STAT, &st) == 0;
        if (targetExists && !isDirectoryAttr(st) && libssh2_sftp_unlink(sftp_, to.c_str()) == 0) {
            rc = libssh2_sftp_rename_ex(sftp_,
                                        from.c_str(), static_cast<unsigned>(from.size()),
                                        to.c_str(), static_cast<unsigned>(to.size()),
                                        flags);
        }
    }
    if (rc != 0) {
        err = "sftp_rename_ex failed: " + from + " -> " + to;
        return false;
    }
    return true;
}

} // namespace remotefs
