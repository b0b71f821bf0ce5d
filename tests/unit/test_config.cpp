#include <gtest/gtest.h>

#include "Config.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace PeerDrop;

TEST(ConfigTest, BasicOperations) {
    Config config;

    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");

    config.setInt("intKey", 42);
    EXPECT_EQ(config.getInt("intKey"), 42);
}

TEST(ConfigTest, ParsesKeyValueText) {
    Config config;
    config.loadFromString(
        "# PeerDrop configuration\n"
        "display_name = Living Room PC\n"
        "\n"
        "service_port=7000\n"
        "  chunk_size =  8192  \n"
        "not a setting\n"
        "verbose = yes\n");

    EXPECT_EQ(config.get("display_name"), "Living Room PC");
    EXPECT_EQ(config.getInt("service_port"), 7000);
    EXPECT_EQ(config.getSize("chunk_size"), 8192u);
    EXPECT_TRUE(config.getBool("verbose"));
    EXPECT_FALSE(config.hasKey("not a setting"));
}

TEST(ConfigTest, StrictNumbers) {
    Config config;
    config.loadFromString("port=80abc\nsize=-5\nflag=maybe\n");

    EXPECT_EQ(config.getInt("port", 1), 1);
    EXPECT_EQ(config.getSize("size", 9), 9u);
    EXPECT_TRUE(config.getBool("flag", true));
}

TEST(ConfigTest, LayeredFilesOverride) {
    auto dir = std::filesystem::temp_directory_path() / ("peerdrop_config_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    auto base = dir / "base.conf";
    auto user = dir / "user.conf";
    {
        std::ofstream(base) << "service_port=1000\nlog_level=info\n";
        std::ofstream(user) << "service_port=2000\n";
    }

    Config config;
    EXPECT_TRUE(config.loadLayered({base.string(), (dir / "missing.conf").string(), user.string()}));
    EXPECT_EQ(config.getInt("service_port"), 2000);
    EXPECT_EQ(config.get("log_level"), "info");

    Config keepFirst;
    keepFirst.loadFromFile(base.string());
    keepFirst.loadFromFile(user.string(), false);
    EXPECT_EQ(keepFirst.getInt("service_port"), 1000);

    EXPECT_FALSE(config.loadFromFile((dir / "missing.conf").string()));
    std::filesystem::remove_all(dir);
}

TEST(ConfigTest, ValidationNamesTheKey) {
    Config config;
    config.loadFromString("service_port=99999\nlog_level=info\n");

    std::unordered_map<std::string, Config::Validator> schema = {
        {"service_port", [](const std::string&, const std::string& v) { return v.size() <= 5 && std::stoi(v) <= 65535; }},
        {"absent_key", [](const std::string&, const std::string&) { return false; }},
    };

    auto result = config.validate(schema);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigurationError);
    EXPECT_NE(result.error().message.find("service_port"), std::string::npos);

    config.set("service_port", "8080");
    EXPECT_TRUE(config.validate(schema).ok());
}
