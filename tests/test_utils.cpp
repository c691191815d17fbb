// tests/test_utils.cpp
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"
#include "../src/models/BackendUrlInfo.hpp"

namespace testing {
    void PrintTo(const BackendUrlInfo& info, std::ostream* os) {
        *os << "BackendUrlInfo{"
            << "name: " << info.name
            << ", url: " << info.url
            << ", backend_host: " << info.backend_host
            << ", backend_port: " << info.backend_port
            << ", is_https: " << (info.is_https ? "true" : "false")
            << "}";
    }
}

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    std::vector<std::string> args = {"=value"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // One bad argument rejects the whole command line.
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for loadConfiguration ---

namespace {
// Keeps warnings out of the test output while a test runs.
class CerrSilencer {
public:
    CerrSilencer() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrSilencer() { std::cerr.rdbuf(old_); }
    std::string text() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

const std::vector<std::string> kNoConfigFiles = {};
}

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({}, kNoConfigFiles);
    EXPECT_EQ(config.frontend_port, 9000);
    EXPECT_EQ(config.cache_ttl_in_millis, 60000);
    EXPECT_EQ(config.cache_max_evicted, 2u);
    EXPECT_EQ(config.cache_scan_interval_in_millis, 60000);
    EXPECT_TRUE(config.backend_map.empty());
}

TEST(UtilsTest, LoadConfigurationCacheSettings) {
    CerrSilencer silence;
    std::map<std::string, std::string> args = {
        {"cache_ttl", "-1"}, {"cache_max_evicted", "5"}, {"cache_scan_interval", "0"}};
    AppConfig config = Utils::loadConfiguration(args, kNoConfigFiles);
    EXPECT_EQ(config.cache_ttl_in_millis, -1);
    EXPECT_EQ(config.cache_max_evicted, 5u);
    EXPECT_EQ(config.cache_scan_interval_in_millis, 0);
}

TEST(UtilsTest, LoadConfigurationMetricsSettings) {
    CerrSilencer silence;
    std::map<std::string, std::string> args = {{"metrics_batch_size", "0"}, {"metrics_send_interval", "250"}};
    AppConfig config = Utils::loadConfiguration(args, kNoConfigFiles);
    EXPECT_EQ(config.metrics_batch_size, 0);
    EXPECT_EQ(config.metrics_send_interval_in_millis, 250);

    AppConfig rejected = Utils::loadConfiguration({{"metrics_send_interval", "0"}}, kNoConfigFiles);
    EXPECT_EQ(rejected.metrics_send_interval_in_millis, 1000);
}

TEST(UtilsTest, LoadConfigurationOverridePortInvalidFormat) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"frontend_port", "abc"}}, kNoConfigFiles);
    EXPECT_EQ(config.frontend_port, 9000);
    EXPECT_NE(silence.text().find("Invalid port"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationOverridePortInvalidRange) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"frontend_port", "70000"}}, kNoConfigFiles);
    EXPECT_EQ(config.frontend_port, 9000);
}

TEST(UtilsTest, LoadConfigurationInvalidLogLevelThrows) {
    CerrSilencer silence;
    EXPECT_THROW(Utils::loadConfiguration({{"log_level", "LOUD"}}, kNoConfigFiles), std::invalid_argument);
}

TEST(UtilsTest, LoadConfigurationAddBackendLowercasesName) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"Users", "http://users-backend:9001"}}, kNoConfigFiles);
    ASSERT_EQ(config.backend_map.size(), 1u);
    ASSERT_TRUE(config.backend_map.count("users"));
    const BackendUrlInfo& info = config.backend_map.at("users");
    EXPECT_EQ(info.name, "users");
    EXPECT_EQ(info.url, "http://users-backend:9001");
    EXPECT_EQ(info.backend_host, "users-backend");
    EXPECT_EQ(info.backend_port, 9001);
}

TEST(UtilsTest, LoadConfigurationIgnoresUnknownArgs) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"some_other_arg", "value"}}, kNoConfigFiles);
    EXPECT_TRUE(config.backend_map.empty());
    EXPECT_NE(silence.text().find("Ignoring unknown argument 'some_other_arg'"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationRejectsInvalidBackendName) {
    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"bad/name", "http://host:1"}}, kNoConfigFiles);
    EXPECT_TRUE(config.backend_map.empty());
}

TEST(UtilsTest, LoadConfigurationReadsFileThenArguments) {
    const std::string path = ::testing::TempDir() + "rescache_test.config";
    {
        std::ofstream out(path);
        out << "# cache settings\n"
            << "cache_ttl = 250\n"
            << "cache_max_evicted=4\n"
            << "\n"
            << "frontend_port=9100\n"
            << "orders = http://orders:8080\n"
            << "not a setting\n";
    }

    CerrSilencer silence;
    AppConfig config = Utils::loadConfiguration({{"frontend_port", "9200"}}, {"/nonexistent/rescache.config", path});
    std::remove(path.c_str());

    EXPECT_EQ(config.cache_ttl_in_millis, 250);
    EXPECT_EQ(config.cache_max_evicted, 4u);
    EXPECT_EQ(config.frontend_port, 9200); // command line wins
    ASSERT_TRUE(config.backend_map.count("orders"));
    EXPECT_EQ(config.backend_map.at("orders").backend_port, 8080);
    EXPECT_NE(silence.text().find("malformed config line"), std::string::npos);
}

// --- Tests for parseUrl ---

TEST(UtilsTest, ParseUrlDefaultsPortByScheme) {
    BackendUrlInfo info;
    ASSERT_TRUE(Utils::parseUrl("http://example.com", &info));
    EXPECT_EQ(info.backend_host, "example.com");
    EXPECT_EQ(info.backend_port, 80);
    EXPECT_FALSE(info.is_https);

    ASSERT_TRUE(Utils::parseUrl("https://example.com/base", &info));
    EXPECT_EQ(info.backend_port, 443);
    EXPECT_TRUE(info.is_https);
}

TEST(UtilsTest, ParseUrlRejectsBadInput) {
    CerrSilencer silence;
    BackendUrlInfo info;
    EXPECT_FALSE(Utils::parseUrl("ftp://example.com", &info));
    EXPECT_FALSE(Utils::parseUrl("http://example.com:0", &info));
    EXPECT_FALSE(Utils::parseUrl("example.com:80", &info));
}

// --- Tests for parseResourceTarget ---

TEST(UtilsTest, ParseResourceTargetSplitsBackendAndPath) {
    auto target = Utils::parseResourceTarget("/resource/Users/api/x?y=1");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->backend, "users");
    EXPECT_EQ(target->path, "/api/x?y=1");
}

TEST(UtilsTest, ParseResourceTargetDefaultsPath) {
    auto bare = Utils::parseResourceTarget("/resource/users");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->path, "/");

    auto query = Utils::parseResourceTarget("/resource/users?x");
    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->backend, "users");
    EXPECT_EQ(query->path, "/?x");
}

TEST(UtilsTest, ParseResourceTargetWithoutBackend) {
    EXPECT_FALSE(Utils::parseResourceTarget("/resource/").has_value());
    EXPECT_FALSE(Utils::parseResourceTarget("/resource//x").has_value());
    EXPECT_FALSE(Utils::parseResourceTarget("/other/users").has_value());
}

// --- Tests for trim and log levels ---

TEST(UtilsTest, TrimStripsWhitespace) {
    EXPECT_EQ(Utils::trim("  a b \t\n"), "a b");
    EXPECT_EQ(Utils::trim(" \t "), "");
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_THROW(Utils::stringToLogLevel("debug"), std::invalid_argument);
}
