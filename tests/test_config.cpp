// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp — Tests for configuration loading
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <peerlink/config.h>
#include <peerlink/crypto.h>

#include <filesystem>
#include <fstream>
#include <map>

using namespace peerlink;
namespace fs = std::filesystem;

namespace {

config::EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / ("peerlink-config-" + crypto::uuid() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& text) { std::ofstream(path_) << text; }

    fs::path path_;
};

} // namespace

TEST(ConfigTest, Defaults) {
    auto c = config::load(std::nullopt, fakeEnv({}));

    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_EQ(c.port, 8080);
    EXPECT_EQ(c.uploadDir, "uploads");
    EXPECT_EQ(c.listenerHost, "127.0.0.1");
    EXPECT_EQ(c.connectTimeoutMs, 5000);
    EXPECT_EQ(c.allocationAttempts, 20);
    EXPECT_EQ(c.codeMin, 1024);
    EXPECT_EQ(c.codeMax, 65535);
    EXPECT_EQ(c.maxUploadBytes, 0u);
    EXPECT_EQ(c.logLevel, "info");
}

TEST(ConfigTest, ApplyJsonOverlaysPresentKeys) {
    config::Config c;
    config::applyJson(c, nlohmann::json{
        {"port", 9000},
        {"uploadDir", "/var/peerlink"},
        {"codeMin", 20000},
        {"codeMax", 20999},
        {"maxUploadBytes", 1048576},
        {"somethingElse", true},
    });

    EXPECT_EQ(c.port, 9000);
    EXPECT_EQ(c.uploadDir, "/var/peerlink");
    EXPECT_EQ(c.codeMin, 20000);
    EXPECT_EQ(c.codeMax, 20999);
    EXPECT_EQ(c.maxUploadBytes, 1048576u);
    EXPECT_EQ(c.host, "0.0.0.0");
}

TEST(ConfigTest, ApplyJsonRejectsBadValues) {
    config::Config c;
    EXPECT_THROW(config::applyJson(c, nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(config::applyJson(c, {{"port", "eighty"}}), std::invalid_argument);
    EXPECT_THROW(config::applyJson(c, {{"codeMax", 70000}}), std::invalid_argument);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    auto c = config::load(std::nullopt, fakeEnv({
        {"PEERLINK_HOST", "127.0.0.1"},
        {"PEERLINK_PORT", "9090"},
        {"UPLOAD_DIR", "/tmp/drop"},
        {"PEERLINK_LOG_LEVEL", "debug"},
    }));

    EXPECT_EQ(c.host, "127.0.0.1");
    EXPECT_EQ(c.port, 9090);
    EXPECT_EQ(c.uploadDir, "/tmp/drop");
    EXPECT_EQ(c.logLevel, "debug");
}

TEST(ConfigTest, BadEnvironmentPortThrows) {
    EXPECT_THROW(config::load(std::nullopt, fakeEnv({{"PEERLINK_PORT", "80x"}})),
                 std::invalid_argument);
    EXPECT_THROW(config::load(std::nullopt, fakeEnv({{"PEERLINK_PORT", "99999"}})),
                 std::invalid_argument);
}

TEST(ConfigTest, ValidateRejectsInconsistentSettings) {
    config::Config c;
    c.codeMin = 5000;
    c.codeMax = 4000;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = config::Config{};
    c.connectTimeoutMs = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = config::Config{};
    c.logLevel = "chatty";
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = config::Config{};
    c.uploadDir.clear();
    EXPECT_THROW(c.validate(), std::invalid_argument);
}

TEST(ConfigTest, DerivedOptions) {
    config::Config c;
    c.listenerHost = "127.0.0.2";
    c.connectTimeoutMs = 750;
    c.allocationAttempts = 7;
    c.maxUploadBytes = 4096;

    EXPECT_EQ(c.brokerOptions().attempts, 7);
    EXPECT_EQ(c.listenerOptions().host, "127.0.0.2");
    EXPECT_EQ(c.bridgeOptions().connectTimeout, std::chrono::milliseconds(750));
    EXPECT_EQ(c.serverOptions().maxBodyBytes, 4096u);
}

TEST_F(ConfigFileTest, FileThenEnvironment) {
    write(R"({"port": 7000, "uploadDir": "from-file", "logLevel": "warn"})");

    auto c = config::load(path_.string(), fakeEnv({{"UPLOAD_DIR", "from-env"}}));
    EXPECT_EQ(c.port, 7000);
    EXPECT_EQ(c.uploadDir, "from-env");
    EXPECT_EQ(c.logLevel, "warn");
}

TEST_F(ConfigFileTest, MissingOrMalformedFileThrows) {
    EXPECT_THROW(config::load(path_.string(), fakeEnv({})), std::invalid_argument);

    write("{ not json");
    EXPECT_THROW(config::load(path_.string(), fakeEnv({})), std::invalid_argument);
}

TEST(ConfigTest, SerializesToJson) {
    config::Config c;
    c.port = 1234;
    nlohmann::json j = c;
    EXPECT_EQ(j["port"], 1234);
    EXPECT_EQ(j["listenerHost"], "127.0.0.1");

    config::Config back;
    config::applyJson(back, j);
    EXPECT_EQ(back.port, 1234);
}
