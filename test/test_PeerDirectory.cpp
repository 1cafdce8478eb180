#include <gtest/gtest.h>
#include "peer_directory.hpp"

using namespace std;

TEST(PeerDirectoryTest, UpdateSkipsSelf) {
    PeerDirectory directory;
    vector<PeerInfo> from_tracker = {
        PeerInfo("alice", "10.0.0.1", 6001),
        PeerInfo("bob", "10.0.0.2", 6002)
    };

    EXPECT_EQ(directory.update(from_tracker, "alice"), 1u);
    EXPECT_FALSE(directory.contains("alice"));
    EXPECT_TRUE(directory.contains("bob"));
}

TEST(PeerDirectoryTest, UpdateOverwritesAddress) {
    PeerDirectory directory;
    directory.update({PeerInfo("bob", "10.0.0.2", 6002)}, "alice");
    directory.update({PeerInfo("bob", "10.0.0.3", 7002)}, "alice");

    auto bob = directory.find("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->ip, "10.0.0.3");
    EXPECT_EQ(bob->port, 7002);
    EXPECT_EQ(directory.size(), 1u);
}

TEST(PeerDirectoryTest, UpdateKeepsPeersTheTrackerDropped) {
    PeerDirectory directory;
    directory.update({PeerInfo("bob", "10.0.0.2", 6002), PeerInfo("carol", "10.0.0.3", 6003)},
                     "alice");
    directory.update({PeerInfo("carol", "10.0.0.3", 6003)}, "alice");

    EXPECT_TRUE(directory.contains("bob"));
    EXPECT_EQ(directory.size(), 2u);
}

TEST(PeerDirectoryTest, PruneReplacesWholesale) {
    PeerDirectory directory;
    directory.update({PeerInfo("bob", "10.0.0.2", 6002), PeerInfo("carol", "10.0.0.3", 6003)},
                     "alice");
    directory.update({PeerInfo("carol", "10.0.0.3", 6003)}, "alice", true);

    EXPECT_FALSE(directory.contains("bob"));
    EXPECT_TRUE(directory.contains("carol"));
}

TEST(PeerDirectoryTest, FindUnknownPeer) {
    PeerDirectory directory;
    EXPECT_FALSE(directory.find("ghost").has_value());
    EXPECT_TRUE(directory.list().empty());
}
