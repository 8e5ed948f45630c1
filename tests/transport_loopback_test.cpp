/**
 * @file transport_loopback_test.cpp
 * @brief Full transaction over real TLS on 127.0.0.1
 *
 * Both sides run in one process: the server owns the receiver's state, the
 * client owns the sender's. Skipped when the loopback socket or the
 * certificate cannot be set up.
 */

#include <gtest/gtest.h>

#include "landrop/CertificateManager.h"
#include "landrop/EventQueue.h"
#include "landrop/LinkLocalCache.h"
#include "landrop/PeerDirectory.h"
#include "landrop/TransactionRegistry.h"
#include "landrop/TransportClient.h"
#include "landrop/TransportServer.h"
#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <variant>

using namespace LanDrop;

class TransportLoopbackTest : public LanDropTest::TempDirTest {
protected:
    TransportLoopbackTest()
        : server(receiverPeers, receiverTransactions, receiverEvents, network,
                 [this]() { return m_dir / "inbox"; }) {}

    void SetUp() override {
        TempDirTest::SetUp();

        std::string errorMsg;
        const std::string certDir = (m_dir / "certs").string();
        if (!CertificateManager::ensureCertificateExists(certDir, "loopback-test", errorMsg)) {
            GTEST_SKIP() << "Certificate setup failed: " << errorMsg;
        }
        if (!server.start("127.0.0.1", 0, false, certDir, errorMsg)) {
            GTEST_SKIP() << "Cannot listen on loopback: " << errorMsg;
        }

        client = std::make_unique<TransportClient>(
            senderPeers, senderTransactions, linkLocal,
            []() { return LocalIdentity{"127.0.0.1", "sender-host", "Sam"}; },
            server.boundPort());
    }

    void TearDown() override {
        server.stop();
        TempDirTest::TearDown();
    }

    std::optional<TransactionRequestedEvent> waitForRequest() {
        while (auto event = receiverEvents.pop(std::chrono::seconds(5))) {
            if (auto* requested = std::get_if<TransactionRequestedEvent>(&*event)) {
                return *requested;
            }
        }
        return std::nullopt;
    }

    // Receiver side
    LanDropTest::FakeHostNetwork network;
    PeerDirectory receiverPeers;
    TransactionRegistry receiverTransactions;
    EventQueue receiverEvents;
    TransportServer server;

    // Sender side
    PeerDirectory senderPeers;
    TransactionRegistry senderTransactions;
    LinkLocalCache linkLocal;
    std::unique_ptr<TransportClient> client;
};

/**
 * @test connect, request, confirm, start over HTTPS; file arrives intact
 */
TEST_F(TransportLoopbackTest, FileArrivesOverTls) {
    std::string payload;
    for (int i = 0; i < 200000; ++i) {
        payload.push_back(static_cast<char>(i % 251));
    }
    writeFile(m_dir / "big.bin", payload);

    ASSERT_TRUE(client->connect("127.0.0.1"));
    EXPECT_TRUE(receiverPeers.contains("127.0.0.1"));

    const std::string id = client->requestTransaction("127.0.0.1", m_dir / "big.bin");
    ASSERT_FALSE(id.empty());

    const auto requested = waitForRequest();
    ASSERT_TRUE(requested.has_value());
    EXPECT_EQ(requested->id, id);
    EXPECT_EQ(requested->fileName, "big.bin");
    EXPECT_EQ(requested->hostname, "sender-host");

    // The sender has no listener here; apply the accept to both registries
    ASSERT_EQ(senderTransactions.setStage(TransactionDirection::Outbound, id, TransactionStage::Confirmed),
              StageChange::Applied);
    ASSERT_EQ(receiverTransactions.setStage(TransactionDirection::Inbound, id, TransactionStage::Confirmed),
              StageChange::Applied);

    ASSERT_TRUE(client->startTransaction(id));

    EXPECT_EQ(readFile(m_dir / "inbox" / "big.bin"), payload);
    EXPECT_EQ(senderTransactions.get(TransactionDirection::Outbound, id)->stage, TransactionStage::Completed);
    EXPECT_EQ(receiverTransactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Completed);
}

TEST_F(TransportLoopbackTest, UnknownCallerRequestIsRefused) {
    EXPECT_TRUE(client->requestTransaction("127.0.0.1", m_dir / "a.txt").empty());
    EXPECT_TRUE(senderTransactions.all(TransactionDirection::Outbound).empty());
}

TEST_F(TransportLoopbackTest, NothingListeningIsConnectFailure) {
    TransportClient other(senderPeers, senderTransactions, linkLocal, nullptr, 1);
    const TransportResult result = other.call("127.0.0.1", "connect", std::nullopt);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.code.empty());
}

TEST_F(TransportLoopbackTest, StopIsIdempotent) {
    server.stop();
    EXPECT_FALSE(server.isRunning());
    server.stop();
}

/**
 * @test Certificate is loaded once at start; later connections do not reread it
 */
TEST_F(TransportLoopbackTest, CertificateIsLoadedOnceAtStart) {
    const std::string certDir = (m_dir / "certs").string();
    std::filesystem::remove(CertificateManager::getCertFilePath(certDir));
    std::filesystem::remove(CertificateManager::getKeyFilePath(certDir));

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(client->connect("127.0.0.1")) << "connection " << i;
    }
}

TEST_F(TransportLoopbackTest, MissingCertificateFailsStart) {
    TransportServer other(receiverPeers, receiverTransactions, receiverEvents, network,
                          [this]() { return m_dir / "inbox"; });
    std::string errorMsg;
    EXPECT_FALSE(other.start("127.0.0.1", 0, false, m_dir / "no-certs", errorMsg));
    EXPECT_FALSE(errorMsg.empty());
    EXPECT_FALSE(other.isRunning());
}

/**
 * @test Servers stopped and destroyed right after serving connections
 */
TEST_F(TransportLoopbackTest, ServerDestroyedRightAfterStop) {
    const std::filesystem::path certDir = m_dir / "certs";
    for (int round = 0; round < 20; ++round) {
        auto shortLived = std::make_unique<TransportServer>(receiverPeers, receiverTransactions, receiverEvents,
                                                            network, [this]() { return m_dir / "inbox"; });
        std::string errorMsg;
        ASSERT_TRUE(shortLived->start("127.0.0.1", 0, false, certDir, errorMsg)) << errorMsg;

        TransportClient caller(senderPeers, senderTransactions, linkLocal,
                               []() { return LocalIdentity{"127.0.0.1", "sender-host", "Sam"}; },
                               shortLived->boundPort());
        EXPECT_TRUE(caller.connect("127.0.0.1"));
        EXPECT_TRUE(caller.connect("127.0.0.1"));

        shortLived->stop();
        EXPECT_FALSE(shortLived->isRunning());
        shortLived.reset();
    }
}
