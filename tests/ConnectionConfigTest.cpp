// Access tokens, environment overrides and validation.
#include <gtest/gtest.h>
#include "remotefs/Base64.hpp"
#include "remotefs/ConnectionConfig.hpp"

#include <map>

using namespace remotefs;

namespace {

std::string token(const std::string& plain) {
    return encodeBase64(ByteBuffer(plain.begin(), plain.end()));
}

EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(ConnectionConfig, Defaults) {
    ConnectionConfig cfg;
    EXPECT_EQ(cfg.port, 22);
    EXPECT_EQ(cfg.timeoutSeconds, 30);
    EXPECT_EQ(cfg.defaultPath, "/");
    EXPECT_EQ(cfg.backend, BackendKind::Sftp);
    EXPECT_EQ(cfg.knownHostsPolicy, KnownHostsPolicy::Strict);
}

TEST(ConnectionConfig, JsonToken) {
    ConnectionConfig cfg;
    std::string err;
    const std::string t = token(R"({"server":"files.example.com","port":2222,"username":"bob",)"
                                R"("password":"s3cret","dir":"/pub","timeoutSeconds":5})");
    ASSERT_TRUE(applyAccessToken(t, cfg, err)) << err;
    EXPECT_EQ(cfg.host, "files.example.com");
    EXPECT_EQ(cfg.port, 2222);
    EXPECT_EQ(cfg.username, "bob");
    EXPECT_EQ(cfg.password.value(), "s3cret");
    EXPECT_EQ(cfg.defaultPath, "/pub");
    EXPECT_EQ(cfg.timeoutSeconds, 5);
}

TEST(ConnectionConfig, JsonTokenKeysAreCaseInsensitive) {
    ConnectionConfig cfg;
    std::string err;
    ASSERT_TRUE(applyAccessToken(token(R"({"Host":"h1","PORT":"2200","UserName":"u","KnownHostsPolicy":"off"})"),
                                 cfg, err)) << err;
    EXPECT_EQ(cfg.host, "h1");
    EXPECT_EQ(cfg.port, 2200);
    EXPECT_EQ(cfg.username, "u");
    EXPECT_EQ(cfg.knownHostsPolicy, KnownHostsPolicy::Off);
}

TEST(ConnectionConfig, HostWinsOverServer) {
    ConnectionConfig cfg;
    std::string err;
    ASSERT_TRUE(applyAccessToken(token(R"({"server":"a","host":"b"})"), cfg, err));
    EXPECT_EQ(cfg.host, "b");
}

TEST(ConnectionConfig, ColonTokenWithBearerPrefix) {
    ConnectionConfig cfg;
    std::string err;
    ASSERT_TRUE(applyAccessToken("Bearer " + token("ftp.example.com:2121:alice:p:w:/in/box"), cfg, err)) << err;
    EXPECT_EQ(cfg.host, "ftp.example.com");
    EXPECT_EQ(cfg.port, 2121);
    EXPECT_EQ(cfg.username, "alice");
    // The password is the fourth field; the directory keeps any further colons.
    EXPECT_EQ(cfg.password.value(), "p");
    EXPECT_EQ(cfg.defaultPath, "w:/in/box");
}

TEST(ConnectionConfig, ColonTokenBadPortKeepsDefault) {
    ConnectionConfig cfg;
    std::string err;
    ASSERT_TRUE(applyAccessToken(token("h:notaport:u:p:"), cfg, err)) << err;
    EXPECT_EQ(cfg.port, 22);
    EXPECT_EQ(cfg.defaultPath, "/");
}

TEST(ConnectionConfig, RejectsBadTokens) {
    ConnectionConfig cfg;
    std::string err;
    EXPECT_FALSE(applyAccessToken("", cfg, err));
    EXPECT_FALSE(applyAccessToken("Bearer   ", cfg, err));
    EXPECT_FALSE(applyAccessToken("!!!", cfg, err));
    EXPECT_FALSE(applyAccessToken(token("just-a-host"), cfg, err));
    EXPECT_FALSE(applyAccessToken(token(R"({"port":70000})"), cfg, err));
    EXPECT_FALSE(err.empty());
}

TEST(ConnectionConfig, JsonTokenNumbers) {
    ConnectionConfig cfg;
    std::string err;
    ASSERT_TRUE(applyAccessToken(token(R"({"host":"h","username":9223372036854775808,"port":2200})"),
                                 cfg, err)) << err;
    // Above INT64_MAX stays unsigned instead of wrapping negative.
    EXPECT_EQ(cfg.username, "9223372036854775808");
    EXPECT_EQ(cfg.port, 2200);

    ConnectionConfig fractional;
    EXPECT_FALSE(applyAccessToken(token(R"({"host":"h","port":22.0})"), fractional, err));
    EXPECT_NE(err.find("port"), std::string::npos);
    EXPECT_FALSE(applyAccessToken(token(R"({"host":"h","timeoutSeconds":1.5})"), fractional, err));
}

TEST(ConnectionConfig, EnvironmentOverridesToken) {
    ConnectionConfig cfg;
    std::string err;
    auto env = fakeEnv({
        {"REMOTEFS_TOKEN", token(R"({"host":"from-token","username":"t"})")},
        {"REMOTEFS_HOST", "from-env"},
        {"REMOTEFS_PORT", "2022"},
        {"REMOTEFS_TIMEOUT", "7"},
        {"REMOTEFS_BACKEND", "mock"},
    });
    ASSERT_TRUE(applyEnvironment(env, cfg, err)) << err;
    EXPECT_EQ(cfg.host, "from-env");
    EXPECT_EQ(cfg.username, "t");
    EXPECT_EQ(cfg.port, 2022);
    EXPECT_EQ(cfg.timeoutSeconds, 7);
    EXPECT_EQ(cfg.backend, BackendKind::Mock);
}

TEST(ConnectionConfig, EnvironmentRejectsInvalidValues) {
    std::string err;
    ConnectionConfig a;
    EXPECT_FALSE(applyEnvironment(fakeEnv({{"REMOTEFS_PORT", "0"}}), a, err));
    ConnectionConfig b;
    EXPECT_FALSE(applyEnvironment(fakeEnv({{"REMOTEFS_TIMEOUT", "soon"}}), b, err));
    ConnectionConfig c;
    EXPECT_FALSE(applyEnvironment(fakeEnv({{"REMOTEFS_BACKEND", "ftp"}}), c, err));
}

TEST(ConnectionConfig, ParseHelpers) {
    EXPECT_TRUE(parseBool(std::string("YES"), false));
    EXPECT_TRUE(parseBool(std::string("1"), false));
    EXPECT_FALSE(parseBool(std::string("nope"), true));
    EXPECT_TRUE(parseBool(std::nullopt, true));

    KnownHostsPolicy p = KnownHostsPolicy::Strict;
    EXPECT_TRUE(parseKnownHostsPolicy("accept-new", p));
    EXPECT_EQ(p, KnownHostsPolicy::AcceptNew);
    EXPECT_FALSE(parseKnownHostsPolicy("maybe", p));

    std::uint16_t port = 0;
    EXPECT_TRUE(parsePort("65535", port));
    EXPECT_EQ(port, 65535);
    EXPECT_FALSE(parsePort("65536", port));
    EXPECT_FALSE(parsePort("-1", port));

    int n = 0;
    EXPECT_TRUE(parsePositiveInt(" 12 ", n));
    EXPECT_EQ(n, 12);
    EXPECT_FALSE(parsePositiveInt("10abc", n));
    EXPECT_FALSE(parsePositiveInt("0", n));
    EXPECT_FALSE(parsePositiveInt("", n));
    EXPECT_EQ(n, 12);
}

TEST(ConnectionConfig, Validation) {
    std::string err;
    ConnectionConfig sftp;
    EXPECT_FALSE(validateConfig(sftp, err));
    EXPECT_EQ(err, "Host is required");

    ConnectionConfig mock;
    mock.backend = BackendKind::Mock;
    mock.timeoutSeconds = 0;
    mock.defaultPath = " ";
    ASSERT_TRUE(validateConfig(mock, err));
    EXPECT_EQ(mock.timeoutSeconds, 1);
    EXPECT_EQ(mock.defaultPath, "/");
}

TEST(ConnectionConfig, ToSessionOptions) {
    ConnectionConfig cfg;
    cfg.host = "h";
    cfg.port = 2200;
    cfg.username = "u";
    cfg.privateKeyPath = "/k";
    cfg.timeoutSeconds = 9;
    const SessionOptions opt = cfg.toSessionOptions();
    EXPECT_EQ(opt.host, "h");
    EXPECT_EQ(opt.port, 2200);
    EXPECT_EQ(opt.username, "u");
    EXPECT_EQ(opt.private_key_path.value(), "/k");
    EXPECT_FALSE(opt.password.has_value());
    EXPECT_EQ(opt.timeout_seconds, 9);
}
