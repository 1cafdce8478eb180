#include <gtest/gtest.h>
#include "peer_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <thread>
#include <vector>

using namespace std;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static const PeerRecord *findRecord(const vector<PeerRecord> &records, const string &id) {
    auto it = find_if(records.begin(), records.end(),
                      [&](const PeerRecord &r) { return r.peer_id == id; });
    return it == records.end() ? nullptr : &*it;
}

// -----------------------
// REGISTER
// -----------------------
TEST(PeerRegistryTest, RegisterReturnsPeerCount) {
    PeerRegistry registry;
    EXPECT_EQ(registry.register_peer("alice", "10.0.0.1", 6001), 1u);
    EXPECT_EQ(registry.register_peer("bob", "10.0.0.2", 6002), 2u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(PeerRegistryTest, ReRegisterOverwritesWithoutGrowing) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001, 1000);
    size_t count = registry.register_peer("alice", "10.0.0.9", 7000, 1050);

    EXPECT_EQ(count, 1u);
    auto records = registry.list();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ip, "10.0.0.9");
    EXPECT_EQ(records[0].port, 7000);
    EXPECT_EQ(records[0].last_seen, 1050);
}

TEST(PeerRegistryTest, LastSeenNeverMovesBackwards) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001, 2000);
    registry.heartbeat("alice", 1500);
    EXPECT_EQ(registry.list()[0].last_seen, 2000);

    registry.register_peer("alice", "10.0.0.1", 6001, 1800);
    EXPECT_EQ(registry.list()[0].last_seen, 2000);
}

// -----------------------
// UNREGISTER / HEARTBEAT
// -----------------------
TEST(PeerRegistryTest, UnregisterRemovesPeer) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001);
    registry.unregister_peer("alice");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(PeerRegistryTest, UnregisterUnknownThrowsNotFound) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001);
    EXPECT_THROW(registry.unregister_peer("ghost"), NotFound);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(PeerRegistryTest, HeartbeatUpdatesLastSeen) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001, 1000);
    registry.heartbeat("alice", 1200);
    EXPECT_EQ(registry.list()[0].last_seen, 1200);
}

TEST(PeerRegistryTest, HeartbeatUnknownDoesNotCreateRecord) {
    PeerRegistry registry;
    EXPECT_THROW(registry.heartbeat("ghost"), NotFound);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.list().empty());
}

// -----------------------
// LIST / SWEEP
// -----------------------
TEST(PeerRegistryTest, ListIsASnapshot) {
    PeerRegistry registry;
    registry.register_peer("alice", "10.0.0.1", 6001);
    auto records = registry.list();

    registry.register_peer("bob", "10.0.0.2", 6002);
    registry.unregister_peer("alice");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].peer_id, "alice");
}

TEST(PeerRegistryTest, SweepEvictsOnlyPeersPastTimeout) {
    PeerRegistry registry(300);
    registry.register_peer("stale", "10.0.0.1", 6001, 1000);
    registry.register_peer("fresh", "10.0.0.2", 6002, 1250);

    /* exactly at the timeout is still alive */
    EXPECT_TRUE(registry.sweep(1300).empty());
    ASSERT_NE(findRecord(registry.list(), "stale"), nullptr);

    auto evicted = registry.sweep(1301);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "stale");

    auto records = registry.list();
    EXPECT_EQ(findRecord(records, "stale"), nullptr);
    EXPECT_NE(findRecord(records, "fresh"), nullptr);
}

TEST(PeerRegistryTest, HeartbeatKeepsPeerAlive) {
    PeerRegistry registry(300);
    registry.register_peer("alice", "10.0.0.1", 6001, 1000);
    registry.heartbeat("alice", 1280);
    EXPECT_TRUE(registry.sweep(1500).empty());
    EXPECT_EQ(registry.sweep(1600).size(), 1u);
}

TEST(PeerRegistryTest, ConcurrentRegistrationsAreAllKept) {
    PeerRegistry registry;
    vector<thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 50; i++) {
                string id = "peer-" + to_string(t) + "-" + to_string(i);
                registry.register_peer(id, "127.0.0.1", static_cast<uint16_t>(7000 + i));
                registry.heartbeat(id);
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }
    EXPECT_EQ(registry.size(), 400u);
}
