// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for Configuration Management
//
// Tests cover:
// - Default values
// - JSON loading of accounts and credentials
// - Parse and validation errors
// - Environment and command line overrides
// - Redacted configuration dump

#include <gtest/gtest.h>
#include "iptvmux/core/config_manager.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace iptvmux {
namespace core {
namespace test {

namespace {

const char* kFullConfig = R"({
  "server": { "bindAddress": "127.0.0.1", "port": 9090, "maxConnections": 64 },
  "logging": { "level": "debug", "enableJson": true, "enableConsole": false },
  "multiplexer": { "chunkSize": 32768, "subscriberQueueDepth": 20, "idleTimeoutSeconds": 45 },
  "upstream": { "defaultUserAgent": "VLC/3.0", "maxRedirects": 3 },
  "accounts": [
    {
      "id": 1,
      "name": "Primary",
      "server": "http://provider.example:8080",
      "credentials": [
        { "id": 10, "username": "alice", "password": "secret-a", "maxConnections": 2 },
        { "id": 11, "username": "bob", "password": "secret-b", "enabled": false }
      ]
    },
    {
      "id": 2,
      "server": "provider2.example",
      "enabled": false,
      "username": "legacy",
      "password": "legacy-pass"
    }
  ]
})";

} // anonymous namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& name : envVars_) {
            unsetenv(name.c_str());
        }
    }

    void setEnv(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        envVars_.push_back(name);
    }

    ConfigManager manager_;
    std::vector<std::string> envVars_;
};

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.server.bindAddress, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.multiplexer.chunkSize, 65536u);
    EXPECT_EQ(config.multiplexer.subscriberQueueDepth, 50u);
    EXPECT_EQ(config.multiplexer.connectTimeoutSeconds, 60u);
    EXPECT_EQ(config.multiplexer.readTimeoutSeconds, 120u);
    EXPECT_EQ(config.multiplexer.idleTimeoutSeconds, 30u);
    EXPECT_EQ(config.upstream.defaultUserAgent, "okhttp/3.14.9");
    EXPECT_TRUE(config.accounts.empty());
    EXPECT_TRUE(manager_.validate().isSuccess());
}

TEST_F(ConfigManagerTest, LoadsAccountsAndCredentials) {
    auto result = manager_.loadFromJsonString(kFullConfig);
    ASSERT_TRUE(result.isSuccess()) << result.error().message;

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.server.bindAddress, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.maxConnections, 64u);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Debug);
    EXPECT_TRUE(config.logging.enableJson);
    EXPECT_FALSE(config.logging.enableConsole);
    EXPECT_EQ(config.multiplexer.chunkSize, 32768u);
    EXPECT_EQ(config.multiplexer.subscriberQueueDepth, 20u);
    EXPECT_EQ(config.multiplexer.idleTimeoutSeconds, 45u);
    EXPECT_EQ(config.multiplexer.readTimeoutSeconds, 120u);
    EXPECT_EQ(config.upstream.defaultUserAgent, "VLC/3.0");
    EXPECT_EQ(config.upstream.maxRedirects, 3u);

    ASSERT_EQ(config.accounts.size(), 2u);
    const AccountConfig& primary = config.accounts[0];
    EXPECT_EQ(primary.id, 1);
    EXPECT_EQ(primary.name, "Primary");
    EXPECT_TRUE(primary.enabled);
    ASSERT_EQ(primary.credentials.size(), 2u);
    EXPECT_EQ(primary.credentials[0].id, 10);
    EXPECT_EQ(primary.credentials[0].username, "alice");
    EXPECT_EQ(primary.credentials[0].maxConnections, 2u);
    EXPECT_TRUE(primary.credentials[0].enabled);
    EXPECT_EQ(primary.credentials[1].maxConnections, 1u);
    EXPECT_FALSE(primary.credentials[1].enabled);

    const AccountConfig& legacy = config.accounts[1];
    EXPECT_FALSE(legacy.enabled);
    EXPECT_TRUE(legacy.credentials.empty());
    EXPECT_EQ(legacy.username, "legacy");
    EXPECT_EQ(legacy.password, "legacy-pass");
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() /
                    ("iptvmux_config_test_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << kFullConfig;
    }

    auto result = manager_.loadFromFile(path.string());
    fs::remove(path);

    ASSERT_TRUE(result.isSuccess()) << result.error().message;
    EXPECT_EQ(manager_.getConfig().accounts.size(), 2u);
}

TEST_F(ConfigManagerTest, MissingFileIsReported) {
    auto result = manager_.loadFromFile("/nonexistent/iptvmux.json");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, ParseErrorCarriesLine) {
    auto result = manager_.loadFromJsonString("{\n  \"server\": {\n    \"port\": ,\n  }\n}");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
    EXPECT_EQ(result.error().line, 3);
}

TEST_F(ConfigManagerTest, WrongTypeNamesTheField) {
    auto result = manager_.loadFromJsonString(R"({"server": {"port": "eighty"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(result.error().field, "server.port");
}

TEST_F(ConfigManagerTest, DuplicateCredentialIdRejectedAndConfigUnchanged) {
    auto result = manager_.loadFromJsonString(R"({
      "server": {"port": 7000},
      "accounts": [
        {"id": 1, "server": "a.example", "credentials": [{"id": 5, "username": "x"}]},
        {"id": 2, "server": "b.example", "credentials": [{"id": 5, "username": "y"}]}
      ]
    })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "accounts[1].credentials[0].id");
    EXPECT_NE(result.error().message.find("Duplicate credential id 5"), std::string::npos);

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_TRUE(config.accounts.empty());
}

TEST_F(ConfigManagerTest, AccountRequiresServer) {
    auto result = manager_.loadFromJsonString(R"({"accounts": [{"id": 3}]})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "accounts[0].server");
}

TEST_F(ConfigManagerTest, CredentialRequiresId) {
    auto result = manager_.loadFromJsonString(
        R"({"accounts": [{"id": 3, "server": "s", "credentials": [{"username": "u"}]}]})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "accounts[0].credentials[0].id");
}

TEST_F(ConfigManagerTest, InvalidLogLevelRejected) {
    auto result = manager_.loadFromJsonString(R"({"logging": {"level": "loud"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.level");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesApply) {
    setEnv("IPTVMUX_PORT", "9191");
    setEnv("IPTVMUX_LOG_LEVEL", "warn");
    setEnv("IPTVMUX_LOG_JSON", "yes");
    setEnv("IPTVMUX_IDLE_TIMEOUT", "12");
    setEnv("IPTVMUX_USER_AGENT", "TestAgent/1.0");

    manager_.applyEnvironmentOverrides();
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.server.port, 9191);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Warning);
    EXPECT_TRUE(config.logging.enableJson);
    EXPECT_EQ(config.multiplexer.idleTimeoutSeconds, 12u);
    EXPECT_EQ(config.upstream.defaultUserAgent, "TestAgent/1.0");
}

TEST_F(ConfigManagerTest, InvalidEnvironmentValueIgnored) {
    std::vector<std::string> logLines;
    manager_.setLogCallback([&logLines](const std::string& line) { logLines.push_back(line); });
    setEnv("IPTVMUX_PORT", "99999");
    setEnv("IPTVMUX_CHUNK_SIZE", "-5");

    manager_.applyEnvironmentOverrides();
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.multiplexer.chunkSize, 65536u);

    bool warned = false;
    for (const auto& line : logLines) {
        if (line.find("Invalid IPTVMUX_PORT") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(ConfigManagerTest, CommandLineOverridesWinOverFile) {
    ASSERT_TRUE(manager_.loadFromJsonString(kFullConfig).isSuccess());

    ConfigOverrides overrides;
    overrides.port = 7777;
    overrides.logLevel = LogLevelConfig::Error;
    manager_.applyOverrides(overrides);

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.server.port, 7777);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Error);
    EXPECT_EQ(config.server.bindAddress, "127.0.0.1");
    EXPECT_TRUE(config.logging.enableJson);
}

TEST_F(ConfigManagerTest, DumpMasksPasswords) {
    ASSERT_TRUE(manager_.loadFromJsonString(kFullConfig).isSuccess());

    std::string dump = manager_.dumpConfig();

    EXPECT_NE(dump.find("\"username\": \"alice\""), std::string::npos);
    EXPECT_NE(dump.find("\"password\": \"***\""), std::string::npos);
    EXPECT_EQ(dump.find("secret-a"), std::string::npos);
    EXPECT_EQ(dump.find("secret-b"), std::string::npos);
    EXPECT_EQ(dump.find("legacy-pass"), std::string::npos);
}

} // namespace test
} // namespace core
} // namespace iptvmux
