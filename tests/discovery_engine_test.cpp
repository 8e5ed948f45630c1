#include <gtest/gtest.h>

#include "landrop/DiscoveryEngine.h"
#include "landrop/ErrorCodes.h"
#include "landrop/EventQueue.h"
#include "landrop/PeerDirectory.h"
#include "landrop/TransactionRegistry.h"
#include "landrop/config.h"
#include "test_support.h"

#include <chrono>
#include <variant>

using namespace LanDrop;

class DiscoveryEngineTest : public ::testing::Test {
protected:
    DiscoveryEngineTest() : engine(peers, transactions, events, network) {}

    std::chrono::steady_clock::time_point afterTtl() const {
        return std::chrono::steady_clock::now() + std::chrono::milliseconds(PEER_TTL_MS + 1000);
    }

    size_t countFinishedEvents() {
        size_t count = 0;
        while (auto event = events.tryPop()) {
            if (std::holds_alternative<TransactionFinishedEvent>(*event)) {
                ++count;
            }
        }
        return count;
    }

    LanDropTest::FakeHostNetwork network;
    PeerDirectory peers;
    TransactionRegistry transactions;
    EventQueue events;
    DiscoveryEngine engine;
};

//=============================================================================
// Sweep
//=============================================================================

TEST_F(DiscoveryEngineTest, FreshPeersSurviveSweep) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    EXPECT_TRUE(engine.sweep(std::chrono::steady_clock::now()).empty());
    EXPECT_TRUE(peers.contains("192.0.2.5"));
}

/**
 * @test A silent discovered peer is removed and its inbound transactions canceled
 */
TEST_F(DiscoveryEngineTest, ExpiredPeerIsRemovedAndInboundCanceled) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    auto inbound = transactions.createInbound("192.0.2.5", "a.txt", "/tmp");
    ASSERT_TRUE(transactions.createOutbound("out", "192.0.2.5", "/tmp/b").has_value());
    ASSERT_TRUE(inbound.has_value());

    const auto removed = engine.sweep(afterTtl());

    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed.front(), "192.0.2.5");
    EXPECT_FALSE(peers.contains("192.0.2.5"));
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, inbound->id)->stage, TransactionStage::Canceled);
    // Outbound transactions are left alone
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "out")->stage, TransactionStage::Requested);
    EXPECT_EQ(countFinishedEvents(), 1u);
}

TEST_F(DiscoveryEngineTest, ExpiryLeavesCompletedInboundAlone) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    auto inbound = transactions.createInbound("192.0.2.5", "a.txt", "/tmp");
    transactions.setStage(TransactionDirection::Inbound, inbound->id, TransactionStage::Completed);

    engine.sweep(afterTtl());

    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, inbound->id)->stage, TransactionStage::Completed);
    EXPECT_EQ(countFinishedEvents(), 0u);
}

/**
 * @test Manually added peers are never removed by a sweep
 */
TEST_F(DiscoveryEngineTest, ManualPeersNeverExpire) {
    std::string errorMsg;
    ASSERT_TRUE(engine.addManually("nas", "192.0.2.20", errorMsg)) << errorMsg;
    auto inbound = transactions.createInbound("192.0.2.20", "a.txt", "/tmp");

    const auto farFuture = std::chrono::steady_clock::now() + std::chrono::hours(24 * 365);
    EXPECT_TRUE(engine.sweep(farFuture).empty());
    EXPECT_TRUE(peers.contains("192.0.2.20"));
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, inbound->id)->stage, TransactionStage::Requested);
}

//=============================================================================
// addManually
//=============================================================================

TEST_F(DiscoveryEngineTest, AddManuallyStoresUndiscoveredPeer) {
    std::string errorMsg;
    ASSERT_TRUE(engine.addManually("  nas  ", " [2001:db8::20] ", errorMsg)) << errorMsg;

    auto peer = peers.get("2001:db8::20");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->displayName, "nas");
    EXPECT_FALSE(peer->discovered);

    // One PeersChanged for the observers
    auto event = events.tryPop();
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<PeersChangedEvent>(*event));
}

TEST_F(DiscoveryEngineTest, AddManuallyRejectsMalformedAddress) {
    std::string errorMsg;
    EXPECT_FALSE(engine.addManually("bad", "not-an-address", errorMsg));
    EXPECT_NE(errorMsg.find(ErrorCodes::ADDR_MALFORMED), std::string::npos);
    EXPECT_FALSE(engine.addManually("bad", "", errorMsg));
    EXPECT_FALSE(engine.addManually("bad", "300.1.2.3", errorMsg));
    EXPECT_TRUE(peers.all().empty());
}

TEST_F(DiscoveryEngineTest, AddManuallyDoesNotTouchKnownPeer) {
    peers.upsert("192.0.2.5", "alpha", "Alice", true);

    std::string errorMsg;
    EXPECT_FALSE(engine.addManually("other", "192.0.2.5", errorMsg));
    EXPECT_NE(errorMsg.find(ErrorCodes::ADDR_DUPLICATE), std::string::npos);

    auto peer = peers.get("192.0.2.5");
    EXPECT_EQ(peer->displayName, "alpha");
    EXPECT_TRUE(peer->discovered);
}

TEST_F(DiscoveryEngineTest, NotifyCarriesBusyFlags) {
    peers.upsert("192.0.2.5", "alpha", "", true);
    ASSERT_TRUE(transactions.createOutbound("t1", "192.0.2.5", "/tmp/x").has_value());

    engine.notifyPeersChanged();

    auto event = events.tryPop();
    ASSERT_TRUE(event.has_value());
    const auto& changed = std::get<PeersChangedEvent>(*event);
    ASSERT_EQ(changed.peers.size(), 1u);
    EXPECT_TRUE(changed.peers.front().busy);
}
