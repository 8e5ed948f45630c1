#include <gtest/gtest.h>

#include "landrop/PeerDirectory.h"
#include "landrop/TransactionRegistry.h"

#include <chrono>
#include <thread>

using namespace LanDrop;

class PeerDirectoryTest : public ::testing::Test {
protected:
    PeerDirectory peers;
    TransactionRegistry transactions;
};

TEST_F(PeerDirectoryTest, UpsertCreatesPeer) {
    Peer peer = peers.upsert("192.0.2.5", "alpha", "Alice Example", true);

    EXPECT_EQ(peer.address, "192.0.2.5");
    EXPECT_EQ(peer.displayName, "alpha");
    EXPECT_EQ(peer.userLabel, "Alice Example");
    EXPECT_TRUE(peer.discovered);
    EXPECT_TRUE(peers.contains("192.0.2.5"));
}

TEST_F(PeerDirectoryTest, UpsertRefreshesLastSeen) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    const auto first = peers.get("192.0.2.5")->lastSeen;

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    peers.upsert("192.0.2.5", "alpha", "", true);

    EXPECT_GT(peers.get("192.0.2.5")->lastSeen, first);
}

/**
 * @test A /connect from a manually added host does not make it expirable
 */
TEST_F(PeerDirectoryTest, ManualEntriesStayManual) {
    peers.upsert("192.0.2.5", "by hand", "", false);
    Peer peer = peers.upsert("192.0.2.5", "alpha", "Alice", true);

    EXPECT_FALSE(peer.discovered);
    EXPECT_EQ(peer.displayName, "alpha");
    EXPECT_EQ(peer.userLabel, "Alice");
}

TEST_F(PeerDirectoryTest, EmptyNamesDoNotOverwrite) {
    peers.upsert("192.0.2.5", "alpha", "Alice", true);
    Peer peer = peers.upsert("192.0.2.5", "", "", true);
    EXPECT_EQ(peer.displayName, "alpha");
    EXPECT_EQ(peer.userLabel, "Alice");
}

TEST_F(PeerDirectoryTest, RemoveReportsWhetherSomethingWasRemoved) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    EXPECT_TRUE(peers.remove("192.0.2.5"));
    EXPECT_FALSE(peers.remove("192.0.2.5"));
    EXPECT_FALSE(peers.get("192.0.2.5").has_value());
}

/**
 * @test busy is computed live from the registry
 */
TEST_F(PeerDirectoryTest, BusyFollowsTransactions) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    EXPECT_FALSE(peers.isBusy("192.0.2.5", transactions));

    auto tx = transactions.createInbound("192.0.2.5", "a.txt", "/tmp");
    ASSERT_TRUE(tx.has_value());
    EXPECT_TRUE(peers.isBusy("192.0.2.5", transactions));

    transactions.setStage(TransactionDirection::Inbound, tx->id, TransactionStage::Canceled);
    EXPECT_FALSE(peers.isBusy("192.0.2.5", transactions));
}

TEST_F(PeerDirectoryTest, SummariesAreSortedAndCarryBusy) {
    peers.upsert("192.0.2.9", "b", "", true);
    peers.upsert("192.0.2.10", "a", "", false);
    ASSERT_TRUE(transactions.createOutbound("t1", "192.0.2.9", "/tmp/x").has_value());

    const auto summaries = peers.summaries(transactions);
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].peer.address, "192.0.2.10");
    EXPECT_FALSE(summaries[0].busy);
    EXPECT_EQ(summaries[1].peer.address, "192.0.2.9");
    EXPECT_TRUE(summaries[1].busy);
}

TEST_F(PeerDirectoryTest, RemoveExpiredSkipsManualPeers) {
    peers.upsert("192.0.2.5", "discovered", "", true);
    peers.upsert("192.0.2.6", "manual", "", false);

    const auto later = std::chrono::steady_clock::now() + std::chrono::hours(24);
    const auto removed = peers.removeExpired(later, 15000);

    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed.front(), "192.0.2.5");
    EXPECT_TRUE(peers.contains("192.0.2.6"));
}
