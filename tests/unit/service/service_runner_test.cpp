#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "cas/foundation/config_manager.hpp"
#include "cas/foundation/service_logger.hpp"
#include "cas/service/service_runner.hpp"
#include "support/mock_logger.hpp"

using namespace cas::service;
using cas::foundation::ConfigManager;
using cas::foundation::LogCategory;
using cas::foundation::LogLevel;
using cas::foundation::ServiceLogger;
using cas::test::ScopedMockLogger;

// -- Config path resolution ---------------------------------------------------

class ConfigPathTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("CAS_CONFIG_PATH"); }
    void TearDown() override { unsetenv("CAS_CONFIG_PATH"); }
};

TEST_F(ConfigPathTest, DefaultWhenNothingGiven) {
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));
}

TEST_F(ConfigPathTest, EnvironmentOverridesDefault) {
    setenv("CAS_CONFIG_PATH", "/tmp/from-env.yaml", 1);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path("/tmp/from-env.yaml"));
}

TEST_F(ConfigPathTest, CommandLineWins) {
    setenv("CAS_CONFIG_PATH", "/tmp/from-env.yaml", 1);
    EXPECT_EQ(resolveConfigPath("/tmp/cli.yaml"), std::filesystem::path("/tmp/cli.yaml"));
}

TEST_F(ConfigPathTest, MissingFileFailsToLoad) {
    ConfigManager config;
    auto result = loadConfig(config, "/nonexistent/cas-config.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), cas::foundation::ErrorCode::ConfigLoadFailed);
}

TEST(ParseConfigArgTest, FindsFlag) {
    char prog[] = "cas_auth_server";
    char flag[] = "--config";
    char path[] = "/tmp/x.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/x.yaml"));
}

TEST(ParseConfigArgTest, DanglingFlagIsIgnored) {
    char prog[] = "cas_auth_server";
    char flag[] = "--config";
    char* argv[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, argv).empty());
}

// -- Config mapping -----------------------------------------------------------

TEST(BuildAuthConfigTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("unrelated: 1\n").hasValue());

    auto cfg = buildAuthConfig(config);
    AuthConfig defaults;
    EXPECT_EQ(cfg.issuer, defaults.issuer);
    EXPECT_EQ(cfg.accessTokenExpiry, defaults.accessTokenExpiry);
    EXPECT_EQ(cfg.anomaly.maxSessions, defaults.anomaly.maxSessions);
    EXPECT_EQ(cfg.timeouts.cache, defaults.timeouts.cache);
    EXPECT_EQ(cfg.cache.enabled, defaults.cache.enabled);
    EXPECT_EQ(cfg.cache.ttls.roleList, defaults.cache.ttls.roleList);
    EXPECT_EQ(cfg.requestThreads, defaults.requestThreads);
}

TEST(BuildAuthConfigTest, ReadsEverySection) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString(R"(
auth:
  signing_key: "k-0123456789abcdef0123456789abcdef"
  issuer: "cas-prod"
  access_token_expiry_seconds: 60
  refresh_token_expiry_seconds: 3600
  invalidation_retries: 5
anomaly:
  max_sessions: 4
  max_distinct_ips: 2
  max_recent_sessions: 3
  recent_window_seconds: 120
  max_distinct_user_agents: 6
timeouts:
  cache_ms: 10
  geo_ms: 150
  storage_ms: 900
cache:
  enabled: false
  max_entries: 32
  ttl:
    principal_seconds: 1
    permission_set_seconds: 2
    permission_check_seconds: 3
    role_seconds: 4
    principal_roles_seconds: 5
    role_list_seconds: 6
    profile_seconds: 7
executor:
  request_threads: 8
  collaborator_threads: 0
)")
                    .hasValue());

    auto cfg = buildAuthConfig(config);
    EXPECT_EQ(cfg.signingKey, "k-0123456789abcdef0123456789abcdef");
    EXPECT_EQ(cfg.issuer, "cas-prod");
    EXPECT_EQ(cfg.accessTokenExpiry, std::chrono::seconds(60));
    EXPECT_EQ(cfg.refreshTokenExpiry, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.invalidationRetries, 5u);

    EXPECT_EQ(cfg.anomaly.maxSessions, 4u);
    EXPECT_EQ(cfg.anomaly.maxDistinctIps, 2u);
    EXPECT_EQ(cfg.anomaly.maxRecentSessions, 3u);
    EXPECT_EQ(cfg.anomaly.recentWindow, std::chrono::seconds(120));
    EXPECT_EQ(cfg.anomaly.maxDistinctUserAgents, 6u);

    EXPECT_EQ(cfg.timeouts.cache, std::chrono::milliseconds(10));
    EXPECT_EQ(cfg.timeouts.geo, std::chrono::milliseconds(150));
    EXPECT_EQ(cfg.timeouts.storage, std::chrono::milliseconds(900));

    EXPECT_FALSE(cfg.cache.enabled);
    EXPECT_EQ(cfg.cache.maxEntries, 32u);
    EXPECT_EQ(cfg.cache.ttls.principal, std::chrono::seconds(1));
    EXPECT_EQ(cfg.cache.ttls.permissionSet, std::chrono::seconds(2));
    EXPECT_EQ(cfg.cache.ttls.permissionCheck, std::chrono::seconds(3));
    EXPECT_EQ(cfg.cache.ttls.roleById, std::chrono::seconds(4));
    EXPECT_EQ(cfg.cache.ttls.principalRoles, std::chrono::seconds(5));
    EXPECT_EQ(cfg.cache.ttls.roleList, std::chrono::seconds(6));
    EXPECT_EQ(cfg.cache.ttls.profile, std::chrono::seconds(7));

    EXPECT_EQ(cfg.requestThreads, 8u);
    EXPECT_EQ(cfg.collaboratorThreads, 0u);
}

TEST(BuildGeoPrefixesTest, KeepsDottedPrefixes) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString(R"(
geo:
  prefixes:
    "10.": "ZZ"
    "203.0.113.": "AU"
)")
                    .hasValue());

    auto prefixes = buildGeoPrefixes(config);
    ASSERT_EQ(prefixes.size(), 2u);
    EXPECT_EQ(prefixes.at("10."), "ZZ");
    EXPECT_EQ(prefixes.at("203.0.113."), "AU");
}

// -- Log levels ---------------------------------------------------------------

TEST(ApplyLogLevelsTest, AppliesKnownAndReportsUnknown) {
    ScopedMockLogger mock;
    ServiceLogger logger;
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString(R"(
log:
  levels:
    cache: debug
    Security: warn
    bogus: info
    auth: shouty
)")
                    .hasValue());

    EXPECT_EQ(applyLogLevels(config, logger), 2u);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Cache), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Security), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Auth), LogLevel::Info);

    EXPECT_EQ(mock->matching({"[Config] Ignoring unknown log level setting", "category=bogus"})
                  .size(),
              1u);
    EXPECT_EQ(mock->matching({"[Config] Ignoring unknown log level setting", "level=shouty"})
                  .size(),
              1u);
}
