#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "../CatalogLint/config_loader.h"

TEST(ConfigLoaderTest, DefaultsComeFromConfigHeader) {
    RunConfig config;
    EXPECT_EQ(config.probe.timeoutSeconds, PROBE_TIMEOUT_SECONDS);
    EXPECT_EQ(config.probe.maxRedirects, PROBE_MAX_REDIRECTS);
    EXPECT_FALSE(config.probe.userAgents.empty());
    EXPECT_FALSE(config.verbose);
}

TEST(ConfigLoaderTest, OverridesPresentKeys) {
    RunConfig config;
    ASSERT_TRUE(parseConfigString(
        R"({"timeout_seconds": 5, "max_redirects": 2, "user_agents": ["ua-1"], "verbose": true, "extra": 1})", config));
    EXPECT_EQ(config.probe.timeoutSeconds, 5);
    EXPECT_EQ(config.probe.maxRedirects, 2);
    ASSERT_EQ(config.probe.userAgents.size(), 1u);
    EXPECT_EQ(config.probe.userAgents[0], "ua-1");
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.probe.verbose);
}

TEST(ConfigLoaderTest, MissingKeysKeepDefaults) {
    RunConfig config;
    ASSERT_TRUE(parseConfigString(R"({"max_redirects": 0})", config));
    EXPECT_EQ(config.probe.timeoutSeconds, PROBE_TIMEOUT_SECONDS);
    EXPECT_EQ(config.probe.maxRedirects, 0);
}

TEST(ConfigLoaderTest, RejectsInvalidDocuments) {
    RunConfig config;
    EXPECT_FALSE(parseConfigString("{not json", config));
    EXPECT_FALSE(parseConfigString("[1, 2]", config));
    EXPECT_FALSE(parseConfigString(R"({"timeout_seconds": "ten"})", config));
    EXPECT_FALSE(parseConfigString(R"({"timeout_seconds": 0})", config));
    EXPECT_FALSE(parseConfigString(R"({"max_redirects": -1})", config));
    EXPECT_FALSE(parseConfigString(R"({"user_agents": []})", config));
    EXPECT_EQ(config.probe.timeoutSeconds, PROBE_TIMEOUT_SECONDS);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    string path = testing::TempDir() + "cataloglint_config_test.json";
    {
        ofstream out(path);
        out << R"({"timeout_seconds": 9})";
    }
    RunConfig config;
    ASSERT_TRUE(loadConfigFile(path, config));
    EXPECT_EQ(config.probe.timeoutSeconds, 9);
    std::remove(path.c_str());

    EXPECT_FALSE(loadConfigFile("/nonexistent-cataloglint-dir/config.json", config));
}
