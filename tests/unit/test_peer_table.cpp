#include <gtest/gtest.h>

#include "PeerTable.h"

#include <algorithm>

using namespace PeerDrop;

class PeerTableTest : public ::testing::Test {
protected:
    PeerTable::Clock clock() {
        return [this] { return now_; };
    }

    void advance(int seconds) {
        now_ += std::chrono::seconds(seconds);
    }

    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::time_point() + std::chrono::hours(1);
};

TEST_F(PeerTableTest, UpsertReportsNewPeers) {
    PeerTable table(std::chrono::seconds(30), clock());

    EXPECT_TRUE(table.upsert("10.0.0.2", "alice", 65432));
    EXPECT_FALSE(table.upsert("10.0.0.2", "alice-renamed", 7000));
    EXPECT_TRUE(table.upsert("10.0.0.3", "bob", 65432));

    auto peers = table.snapshot();
    ASSERT_EQ(peers.size(), 2u);

    auto alice = std::find_if(peers.begin(), peers.end(), [](const PeerRecord& p) { return p.address == "10.0.0.2"; });
    ASSERT_NE(alice, peers.end());
    EXPECT_EQ(alice->displayName, "alice-renamed");
    EXPECT_EQ(alice->servicePort, 7000);
}

TEST_F(PeerTableTest, StalenessWindow) {
    PeerTable table(std::chrono::seconds(30), clock());
    table.upsert("10.0.0.2", "alice", 65432);

    advance(29);
    EXPECT_EQ(table.snapshot().size(), 1u);

    advance(2);   // T+31
    EXPECT_TRUE(table.snapshot().empty());
    EXPECT_EQ(table.size(), 1u);   // still stored until pruned

    EXPECT_EQ(table.prune(), 1u);
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(PeerTableTest, RefreshKeepsPeerAlive) {
    PeerTable table(std::chrono::seconds(30), clock());
    table.upsert("10.0.0.2", "alice", 65432);

    advance(20);
    table.upsert("10.0.0.2", "alice", 65432);
    advance(20);

    EXPECT_EQ(table.snapshot().size(), 1u);
    EXPECT_EQ(table.prune(), 0u);
}

TEST_F(PeerTableTest, ReturningPeerCountsAsNew) {
    PeerTable table(std::chrono::seconds(30), clock());
    table.upsert("10.0.0.2", "alice", 65432);

    advance(45);
    EXPECT_TRUE(table.upsert("10.0.0.2", "alice", 65432));
}

TEST(PeerTableDefaultClockTest, UsesSteadyClock) {
    PeerTable table(std::chrono::seconds(30));
    table.upsert("10.0.0.9", "carol", 65432);
    EXPECT_EQ(table.snapshot().size(), 1u);
    table.clear();
    EXPECT_EQ(table.size(), 0u);
}
