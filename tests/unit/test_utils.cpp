#include <gtest/gtest.h>

#include "MetricsCollector.h"
#include "PathUtils.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <unistd.h>

using namespace PeerDrop;

class PathUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* value = std::getenv("XDG_CONFIG_HOME")) savedConfigHome_ = value;
    }

    void TearDown() override {
        if (savedConfigHome_) {
            setenv("XDG_CONFIG_HOME", savedConfigHome_->c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
    }

    std::optional<std::string> savedConfigHome_;
};

TEST_F(PathUtilsTest, ConfigFileFollowsXdg) {
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    EXPECT_EQ(PathUtils::getConfigDir(), std::filesystem::path("/tmp/xdg-test/peerdrop"));
    EXPECT_EQ(PathUtils::getConfigFilePath(), std::filesystem::path("/tmp/xdg-test/peerdrop/peerdrop.conf"));

    unsetenv("XDG_CONFIG_HOME");
    if (std::getenv("HOME")) {
        EXPECT_EQ(PathUtils::getConfigDir(), PathUtils::getHome() / ".config" / "peerdrop");
    }
}

TEST_F(PathUtilsTest, EnsureDirectoryCreatesNestedPath) {
    auto base = std::filesystem::temp_directory_path() / ("peerdrop_dirs_" + std::to_string(getpid()));
    auto nested = base / "a" / "b";
    std::filesystem::remove_all(base);

    PathUtils::ensureDirectory(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));

    // Existing directory is fine
    EXPECT_NO_THROW(PathUtils::ensureDirectory(nested));
    std::filesystem::remove_all(base);
}

TEST(MetricsCollectorTest, CountsAndResets) {
    auto& metrics = MetricsCollector::instance();
    metrics.reset();

    metrics.incrementBeaconsDropped();
    metrics.incrementPeersDiscovered();
    metrics.addBytesUploaded(4096);
    metrics.addBytesUploaded(1808);
    metrics.incrementChunksSent();
    metrics.incrementAuthFailures();

    auto discovery = metrics.getDiscoveryMetrics();
    EXPECT_EQ(discovery.beaconsDropped, 1u);
    EXPECT_EQ(discovery.peersDiscovered, 1u);

    auto transfer = metrics.getTransferMetrics();
    EXPECT_EQ(transfer.bytesUploaded, 5904u);
    EXPECT_EQ(transfer.chunksSent, 1u);

    EXPECT_EQ(metrics.getSecurityMetrics().authFailures, 1u);

    auto summary = metrics.getMetricsSummary();
    EXPECT_NE(summary.find("Beacons Dropped: 1"), std::string::npos);
    EXPECT_NE(summary.find("Auth Failures: 1"), std::string::npos);

    metrics.reset();
    EXPECT_EQ(metrics.getTransferMetrics().bytesUploaded, 0u);
    EXPECT_EQ(metrics.getSecurityMetrics().authFailures, 0u);
}
