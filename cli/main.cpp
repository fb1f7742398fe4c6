// Command-line entry point: one remote file operation per invocation,
// result printed to stdout as a JSON document.
#include "remotefs/ConnectionConfig.hpp"
#include "remotefs/FileService.hpp"
#include "remotefs/Libssh2RemoteClient.hpp"
#include "remotefs/Log.hpp"
#include "remotefs/MockRemoteClient.hpp"
#include "remotefs/ResultFormatter.hpp"
#include "remotefs/TextEncoding.hpp"

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using remotefs::ConnectionConfig;
using remotefs::FileService;

struct CliOptions {
    std::optional<std::string> token;
    std::map<std::string, std::string> overrides;  // long option name -> value
    std::string encoding;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* prog) {
    std::fprintf(stderr,
                 "Usage: %s [options] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  list [path]                 list a directory\n"
                 "  read <path>                 download a file (text or base64)\n"
                 "  upload <path> <base64>      upload base64-encoded bytes\n"
                 "  write <path> <text>         write text (see --encoding)\n"
                 "  delete <path>               delete a file\n"
                 "  mkdir <path>                create a directory\n"
                 "  rmdir <path>                remove an empty directory\n"
                 "  rename <path> <newName>     rename within the same directory\n"
                 "  size <path>                 file size in bytes\n"
                 "  mtime <path>                last modification time\n"
                 "  stat <path>                 file metadata\n"
                 "\n"
                 "Options:\n"
                 "  -H, --host HOST             server host\n"
                 "  -p, --port PORT             server port (default 22)\n"
                 "  -u, --user NAME             user name\n"
                 "  -P, --password PASS         password\n"
                 "  -k, --key FILE              private key file\n"
                 "      --passphrase PASS       private key passphrase\n"
                 "      --known-hosts FILE      known_hosts file\n"
                 "      --known-hosts-policy P  strict | accept-new | off\n"
                 "  -d, --dir PATH              default remote directory\n"
                 "  -t, --timeout SECONDS       session timeout (default 30)\n"
                 "  -b, --backend NAME          sftp | mock\n"
                 "      --token TOKEN           access token (base64)\n"
                 "  -e, --encoding NAME         text encoding for write (default utf-8)\n"
                 "  -v, --verbose               log to stderr (REMOTEFS_LOG=1)\n"
                 "  -h, --help                  show this help\n"
                 "\n"
                 "Environment: REMOTEFS_TOKEN, REMOTEFS_HOST, REMOTEFS_PORT, REMOTEFS_USER,\n"
                 "REMOTEFS_PASSWORD, REMOTEFS_KEY, REMOTEFS_DIR, REMOTEFS_TIMEOUT, REMOTEFS_BACKEND.\n",
                 prog);
}

bool parseArgs(int argc, char* argv[], CliOptions& cli, std::vector<std::string>& positional) {
    static const struct option kLongOptions[] = {
        {"host", required_argument, nullptr, 'H'},
        {"port", required_argument, nullptr, 'p'},
        {"user", required_argument, nullptr, 'u'},
        {"password", required_argument, nullptr, 'P'},
        {"key", required_argument, nullptr, 'k'},
        {"passphrase", required_argument, nullptr, 1001},
        {"known-hosts", required_argument, nullptr, 1002},
        {"known-hosts-policy", required_argument, nullptr, 1003},
        {"dir", required_argument, nullptr, 'd'},
        {"timeout", required_argument, nullptr, 't'},
        {"backend", required_argument, nullptr, 'b'},
        {"token", required_argument, nullptr, 1004},
        {"encoding", required_argument, nullptr, 'e'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c = 0;
    int index = 0;
    while ((c = getopt_long(argc, argv, "H:p:u:P:k:d:t:b:e:vh", kLongOptions, &index)) != -1) {
        switch (c) {
            case 'H': cli.overrides["host"] = optarg; break;
            case 'p': cli.overrides["port"] = optarg; break;
            case 'u': cli.overrides["user"] = optarg; break;
            case 'P': cli.overrides["password"] = optarg; break;
            case 'k': cli.overrides["key"] = optarg; break;
            case 1001: cli.overrides["passphrase"] = optarg; break;
            case 1002: cli.overrides["known-hosts"] = optarg; break;
            case 1003: cli.overrides["known-hosts-policy"] = optarg; break;
            case 'd': cli.overrides["dir"] = optarg; break;
            case 't': cli.overrides["timeout"] = optarg; break;
            case 'b': cli.overrides["backend"] = optarg; break;
            case 1004: cli.token = optarg; break;
            case 'e': cli.encoding = optarg; break;
            case 'v': cli.verbose = true; break;
            case 'h': cli.help = true; break;
            default: return false;
        }
    }
    for (int i = optind; i < argc; ++i) positional.emplace_back(argv[i]);
    return true;
}

bool applyFlags(const std::map<std::string, std::string>& flags, ConnectionConfig& cfg, std::string& err) {
    for (const auto& kv : flags) {
        const std::string& name = kv.first;
        const std::string& value = kv.second;
        if (name == "host") {
            cfg.host = value;
        } else if (name == "port") {
            if (!remotefs::parsePort(value, cfg.port)) {
                err = "Invalid --port: " + value;
                return false;
            }
        } else if (name == "user") {
            cfg.username = value;
        } else if (name == "password") {
            cfg.password = value;
        } else if (name == "key") {
            cfg.privateKeyPath = value;
        } else if (name == "passphrase") {
            cfg.privateKeyPassphrase = value;
        } else if (name == "known-hosts") {
            cfg.knownHostsPath = value;
        } else if (name == "known-hosts-policy") {
            if (!remotefs::parseKnownHostsPolicy(value, cfg.knownHostsPolicy)) {
                err = "Invalid --known-hosts-policy: " + value;
                return false;
            }
        } else if (name == "dir") {
            cfg.defaultPath = value;
        } else if (name == "timeout") {
            if (!remotefs::parsePositiveInt(value, cfg.timeoutSeconds)) {
                err = "Invalid --timeout: " + value;
                return false;
            }
        } else if (name == "backend") {
            if (!remotefs::parseBackendKind(value, cfg.backend)) {
                err = "Invalid --backend: " + value;
                return false;
            }
        }
    }
    return true;
}

remotefs::RemoteClientFactory makeFactory(const ConnectionConfig& cfg) {
    if (cfg.backend == remotefs::BackendKind::Mock) {
        auto fs = remotefs::MockFileSystem::withSampleTree();
        return [fs]() { return std::make_unique<remotefs::MockRemoteClient>(fs); };
    }
    return []() { return std::make_unique<remotefs::Libssh2RemoteClient>(); };
}

int fail(const std::string& message) {
    std::cerr << remotefs::renderJson(remotefs::errorToJson(message)) << std::endl;
    return 1;
}

bool requireArgs(const std::vector<std::string>& args, std::size_t count, std::string& err) {
    if (args.size() < count + 1) {
        err = "'" + args[0] + "' needs " + std::to_string(count) + " argument(s)";
        return false;
    }
    return true;
}

bool runCommand(FileService& svc, const std::vector<std::string>& args, const CliOptions& cli,
                nlohmann::json& out, std::string& err) {
    const std::string& cmd = args[0];
    auto arg = [&](std::size_t i) { return i < args.size() ? args[i] : std::string(); };

    if (cmd == "list") return svc.listDirectory(arg(1), out, err);
    if (cmd == "read") return requireArgs(args, 1, err) && svc.downloadFile(arg(1), out, err);
    if (cmd == "upload") return requireArgs(args, 2, err) && svc.uploadFile(arg(1), arg(2), out, err);
    if (cmd == "write") return requireArgs(args, 2, err) && svc.writeFile(arg(1), arg(2), cli.encoding, out, err);
    if (cmd == "delete") return requireArgs(args, 1, err) && svc.deleteFile(arg(1), out, err);
    if (cmd == "mkdir") return requireArgs(args, 1, err) && svc.makeDirectory(arg(1), out, err);
    if (cmd == "rmdir") return requireArgs(args, 1, err) && svc.removeDirectory(arg(1), out, err);
    if (cmd == "rename") return requireArgs(args, 2, err) && svc.rename(arg(1), arg(2), out, err);
    if (cmd == "size") return requireArgs(args, 1, err) && svc.fileSize(arg(1), out, err);
    if (cmd == "mtime") return requireArgs(args, 1, err) && svc.modifiedTime(arg(1), out, err);
    if (cmd == "stat") return requireArgs(args, 1, err) && svc.statPath(arg(1), out, err);
    err = "Unknown command: " + cmd;
    return false;
}

int run(int argc, char* argv[]) {
    CliOptions cli;
    std::vector<std::string> args;
    if (!parseArgs(argc, argv, cli, args)) {
        printUsage(argv[0]);
        return 2;
    }
    if (cli.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (args.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    // Keep REMOTEFS_LOG=debug if the caller already asked for it.
    if (cli.verbose) ::setenv("REMOTEFS_LOG", "1", 0);

    std::string err;
    if (!remotefs::initEncodingSupport(&err)) return fail(err);

    // defaults -> token -> environment -> flags
    ConnectionConfig cfg;
    remotefs::EnvLookup env = remotefs::processEnvironment();
    if (cli.token) {
        const std::string token = *cli.token;
        env = [token, base = env](const std::string& name) -> std::optional<std::string> {
            if (name == "REMOTEFS_TOKEN") return token;
            return base(name);
        };
    }
    if (!remotefs::applyEnvironment(env, cfg, err)) return fail(err);
    if (!applyFlags(cli.overrides, cfg, err)) return fail(err);
    if (cfg.backend == remotefs::BackendKind::Mock && cfg.host.empty()) cfg.host = "localhost";
    if (!remotefs::validateConfig(cfg, err)) return fail(err);

    FileService svc(cfg, makeFactory(cfg));
    nlohmann::json out;
    if (!runCommand(svc, args, cli, out, err)) return fail(err);
    std::cout << remotefs::renderJson(out) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        return fail(std::string("Unexpected error: ") + e.what());
    }
}
