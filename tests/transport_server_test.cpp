#include <gtest/gtest.h>

#include "landrop/EventQueue.h"
#include "landrop/Multipart.h"
#include "landrop/PeerDirectory.h"
#include "landrop/TransactionRegistry.h"
#include "landrop/TransportServer.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <variant>

using namespace LanDrop;
using json = nlohmann::json;

//=============================================================================
// Fixture: drives handleRequest() directly, no sockets
//=============================================================================

class TransportServerTest : public LanDropTest::TempDirTest {
protected:
    static constexpr const char* SENDER = "192.0.2.5";

    TransportServerTest()
        : server(peers, transactions, events, network, [this]() { return m_dir / "downloads"; }) {}

    json post(const std::string& caller, const std::string& endpoint, const json& body) {
        const ServerResponse response = server.handleRequest(caller, "POST", "/" + endpoint,
                                                             "application/json", body.dump());
        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(response.contentType, "application/json");
        return json::parse(response.body, nullptr, false);
    }

    json postStart(const std::string& caller, const std::string& id,
                   const std::string* fileName, const std::string& data) {
        std::vector<MultipartPart> parts;
        if (fileName) {
            MultipartPart file;
            file.name = "file";
            file.fileName = *fileName;
            file.data = data;
            parts.push_back(file);
        }
        MultipartPart meta;
        meta.name = "json";
        meta.fileName = "json";
        meta.data = json{{"transaction_id", id}}.dump();
        parts.push_back(meta);

        const std::string boundary = Multipart::generateBoundary();
        const ServerResponse response = server.handleRequest(caller, "POST", "/start-transaction",
                                                             Multipart::contentType(boundary),
                                                             Multipart::encode(parts, boundary));
        return json::parse(response.body, nullptr, false);
    }

    static std::string status(const json& reply) {
        return reply.is_object() ? reply.value("status", std::string()) : std::string();
    }

    static std::string transactionId(const json& reply) {
        return reply.is_object() ? reply.value("transaction_id", std::string()) : std::string();
    }

    std::string introduceAndRequest(const std::string& caller, const std::string& fileName) {
        post(caller, "connect", {{"address", caller}, {"hostname", "beta"}, {"username", "Bob"}});
        return transactionId(post(caller, "request-transaction",
                                  {{"hostname", "beta"}, {"username", "Bob"}, {"file_name", fileName}}));
    }

    std::vector<Event> drainEvents() {
        std::vector<Event> drained;
        while (auto event = events.tryPop()) {
            drained.push_back(std::move(*event));
        }
        return drained;
    }

    LanDropTest::FakeHostNetwork network;
    PeerDirectory peers;
    TransactionRegistry transactions;
    EventQueue events;
    TransportServer server;
};

//=============================================================================
// Routing
//=============================================================================

TEST_F(TransportServerTest, NonPostIsRefused) {
    const ServerResponse response = server.handleRequest(SENDER, "GET", "/connect", "", "");
    EXPECT_EQ(response.status, 405);
    EXPECT_TRUE(peers.all().empty());
}

TEST_F(TransportServerTest, UnknownPathGetsTextReply) {
    const ServerResponse response = server.handleRequest(SENDER, "POST", "/upload", "application/json", "{}");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.contentType, "text/plain");
    EXPECT_EQ(response.body, "upload unknown");
}

//=============================================================================
// /connect
//=============================================================================

TEST_F(TransportServerTest, ConnectRegistersDiscoveredPeer) {
    const json reply = post(SENDER, "connect", {{"address", SENDER}, {"hostname", "beta"}, {"username", "Bob"}});
    EXPECT_EQ(status(reply), "ok");

    const auto peer = peers.get(SENDER);
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->displayName, "beta");
    EXPECT_EQ(peer->userLabel, "Bob");
    EXPECT_TRUE(peer->discovered);
}

/**
 * @test The transport address wins over the address claimed in the body
 */
TEST_F(TransportServerTest, ConnectKeysPeerByCallerAddress) {
    post(SENDER, "connect", {{"address", "198.51.100.7"}, {"hostname", "beta"}});
    EXPECT_TRUE(peers.contains(SENDER));
    EXPECT_FALSE(peers.contains("198.51.100.7"));
}

TEST_F(TransportServerTest, MappedCallerIsNormalized) {
    post("::ffff:192.0.2.5", "connect", {{"hostname", "beta"}});
    EXPECT_TRUE(peers.contains("192.0.2.5"));
    EXPECT_FALSE(peers.contains("::ffff:192.0.2.5"));

    // Same peer whichever form the next request arrives in
    const json reply = post("::ffff:192.0.2.5", "request-transaction", {{"file_name", "a.txt"}});
    EXPECT_FALSE(transactionId(reply).empty());
    EXPECT_EQ(transactions.all(TransactionDirection::Inbound).front().address, "192.0.2.5");
}

/**
 * @test A known peer calling from its IPv4-mapped form can confirm, cancel and start
 */
TEST_F(TransportServerTest, MappedCallerDrivesEveryTransactionEndpoint) {
    const std::string mapped = "::ffff:192.0.2.5";
    post(SENDER, "connect", {{"hostname", "beta"}});
    transactions.createOutbound("to-confirm", SENDER, m_dir / "a.txt");
    transactions.createOutbound("to-cancel", SENDER, m_dir / "b.txt");

    EXPECT_EQ(transactionId(post(mapped, "confirm-transaction", {{"transaction_id", "to-confirm"}})), "to-confirm");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "to-confirm")->stage, TransactionStage::Confirmed);

    EXPECT_EQ(status(post(mapped, "cancel-transaction", {{"transaction_id", "to-cancel"}})), "ok");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "to-cancel")->stage, TransactionStage::Canceled);

    const std::string inbound = transactionId(post(SENDER, "request-transaction", {{"file_name", "c.txt"}}));
    ASSERT_FALSE(inbound.empty());
    transactions.setStage(TransactionDirection::Inbound, inbound, TransactionStage::Confirmed);

    const std::string name = "c.txt";
    EXPECT_EQ(status(postStart(mapped, inbound, &name, "mapped")), "ok");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, inbound)->stage, TransactionStage::Completed);
    EXPECT_EQ(readFile(m_dir / "downloads" / "c.txt"), "mapped");
    EXPECT_FALSE(peers.contains(mapped));
}

TEST_F(TransportServerTest, ConnectFromOwnAddressIsIgnored) {
    const json reply = post("192.0.2.1", "connect", {{"hostname", "me"}});
    EXPECT_EQ(status(reply), "ok");
    EXPECT_TRUE(peers.all().empty());
}

TEST_F(TransportServerTest, ConnectWithGarbageBodyStillRegisters) {
    const ServerResponse response = server.handleRequest(SENDER, "POST", "/connect", "application/json", "{oops");
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(peers.contains(SENDER));
}

//=============================================================================
// /request-transaction
//=============================================================================

TEST_F(TransportServerTest, RequestFromUnknownCallerIsRejected) {
    const json reply = post(SENDER, "request-transaction", {{"file_name", "a.txt"}});
    EXPECT_EQ(status(reply), "error");
    EXPECT_TRUE(transactions.all(TransactionDirection::Inbound).empty());
    EXPECT_TRUE(drainEvents().empty());
}

TEST_F(TransportServerTest, RequestCreatesInboundAndNotifies) {
    const std::string id = introduceAndRequest(SENDER, "report.pdf");
    ASSERT_FALSE(id.empty());

    const auto tx = transactions.get(TransactionDirection::Inbound, id);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx->stage, TransactionStage::Requested);
    EXPECT_EQ(tx->fileName, "report.pdf");
    EXPECT_EQ(tx->saveFolder, m_dir / "downloads");

    bool requested = false;
    for (const auto& event : drainEvents()) {
        if (const auto* e = std::get_if<TransactionRequestedEvent>(&event)) {
            requested = true;
            EXPECT_EQ(e->id, id);
            EXPECT_EQ(e->address, SENDER);
            EXPECT_EQ(e->hostname, "beta");
            EXPECT_EQ(e->fileName, "report.pdf");
        }
    }
    EXPECT_TRUE(requested);
}

//=============================================================================
// /confirm-transaction and /cancel-transaction (this host is the sender)
//=============================================================================

TEST_F(TransportServerTest, ConfirmOfOutboundEchoesId) {
    post(SENDER, "connect", {{"hostname", "beta"}});
    transactions.createOutbound("t1", SENDER, m_dir / "a.txt");

    const json reply = post(SENDER, "confirm-transaction", {{"transaction_id", "t1"}});
    EXPECT_EQ(transactionId(reply), "t1");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "t1")->stage, TransactionStage::Confirmed);

    size_t confirmed = 0;
    for (const auto& event : drainEvents()) {
        confirmed += std::holds_alternative<TransactionConfirmedEvent>(event) ? 1 : 0;
    }
    EXPECT_EQ(confirmed, 1u);

    // A second confirm does not start a second upload
    EXPECT_EQ(status(post(SENDER, "confirm-transaction", {{"transaction_id", "t1"}})), "error");
    for (const auto& event : drainEvents()) {
        EXPECT_FALSE(std::holds_alternative<TransactionConfirmedEvent>(event));
    }
}

TEST_F(TransportServerTest, ConfirmOfUnknownIdAnswersUnknown) {
    post(SENDER, "connect", {{"hostname", "beta"}});
    EXPECT_EQ(status(post(SENDER, "confirm-transaction", {{"transaction_id", "nope"}})), "unknown");
    EXPECT_EQ(status(post(SENDER, "confirm-transaction", json::object())), "error");
}

TEST_F(TransportServerTest, ConfirmFromUnknownCallerIsRejected) {
    transactions.createOutbound("t1", SENDER, m_dir / "a.txt");
    EXPECT_EQ(status(post(SENDER, "confirm-transaction", {{"transaction_id", "t1"}})), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "t1")->stage, TransactionStage::Requested);
}

/**
 * @test Declined transaction can no longer be confirmed
 */
TEST_F(TransportServerTest, CancelThenConfirm) {
    post(SENDER, "connect", {{"hostname", "beta"}});
    transactions.createOutbound("t1", SENDER, m_dir / "a.txt");

    EXPECT_EQ(status(post(SENDER, "cancel-transaction", {{"transaction_id", "t1"}})), "ok");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "t1")->stage, TransactionStage::Canceled);

    EXPECT_EQ(status(post(SENDER, "confirm-transaction", {{"transaction_id", "t1"}})), "error");
    EXPECT_EQ(status(post(SENDER, "cancel-transaction", {{"transaction_id", "t1"}})), "error");
    EXPECT_EQ(status(post(SENDER, "cancel-transaction", {{"transaction_id", "other"}})), "unknown");
    EXPECT_EQ(transactions.get(TransactionDirection::Outbound, "t1")->stage, TransactionStage::Canceled);
}

//=============================================================================
// /start-transaction (this host is the receiver)
//=============================================================================

TEST_F(TransportServerTest, StartSavesFileAndCompletes) {
    const std::string id = introduceAndRequest(SENDER, "report.txt");
    transactions.setStage(TransactionDirection::Inbound, id, TransactionStage::Confirmed);
    drainEvents();

    const std::string name = "report.txt";
    EXPECT_EQ(status(postStart(SENDER, id, &name, "contents")), "ok");

    EXPECT_EQ(readFile(m_dir / "downloads" / "report.txt"), "contents");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Completed);

    const auto drained = drainEvents();
    ASSERT_EQ(drained.size(), 1u);
    const auto& finished = std::get<TransactionFinishedEvent>(drained.front());
    EXPECT_TRUE(finished.success);
    EXPECT_EQ(finished.stage, TransactionStage::Completed);
}

TEST_F(TransportServerTest, StartNeverOverwrites) {
    std::filesystem::create_directories(m_dir / "downloads");
    writeFile(m_dir / "downloads" / "report.txt", "old");

    const std::string first = introduceAndRequest(SENDER, "report.txt");
    const std::string second = transactionId(post(SENDER, "request-transaction", {{"file_name", "report.txt"}}));
    const std::string name = "report.txt";

    EXPECT_EQ(status(postStart(SENDER, first, &name, "one")), "ok");
    EXPECT_EQ(status(postStart(SENDER, second, &name, "two")), "ok");

    EXPECT_EQ(readFile(m_dir / "downloads" / "report.txt"), "old");
    EXPECT_EQ(readFile(m_dir / "downloads" / "report_1.txt"), "one");
    EXPECT_EQ(readFile(m_dir / "downloads" / "report_2.txt"), "two");
}

TEST_F(TransportServerTest, StartStripsDirectoriesFromFileName) {
    const std::string id = introduceAndRequest(SENDER, "x");
    const std::string name = "../../escape.txt";
    EXPECT_EQ(status(postStart(SENDER, id, &name, "data")), "ok");
    EXPECT_EQ(readFile(m_dir / "downloads" / "escape.txt"), "data");
    EXPECT_FALSE(std::filesystem::exists(m_dir / "escape.txt"));
}

/**
 * @test Missing file part still completes the transaction
 */
TEST_F(TransportServerTest, StartWithoutFilePartCompletes) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    drainEvents();

    EXPECT_EQ(status(postStart(SENDER, id, nullptr, "")), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Completed);
    EXPECT_FALSE(std::filesystem::exists(m_dir / "downloads" / "a.txt"));

    const auto drained = drainEvents();
    ASSERT_EQ(drained.size(), 1u);
    EXPECT_FALSE(std::get<TransactionFinishedEvent>(drained.front()).success);
}

/**
 * @test A save folder that cannot be created still completes the transaction
 */
TEST_F(TransportServerTest, StartWithUnwritableFolderCompletes) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    writeFile(m_dir / "blocker", "not a directory");
    ASSERT_TRUE(transactions.setSaveFolder(id, m_dir / "blocker" / "sub"));
    drainEvents();

    const std::string name = "a.txt";
    EXPECT_EQ(status(postStart(SENDER, id, &name, "data")), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Completed);
    EXPECT_FALSE(std::filesystem::exists(m_dir / "blocker" / "sub"));

    const auto drained = drainEvents();
    ASSERT_EQ(drained.size(), 1u);
    const auto& finished = std::get<TransactionFinishedEvent>(drained.front());
    EXPECT_FALSE(finished.success);
    EXPECT_EQ(finished.stage, TransactionStage::Completed);
}

/**
 * @test Save folder path taken by a regular file
 */
TEST_F(TransportServerTest, StartIntoFileNamedLikeFolderCompletes) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    writeFile(m_dir / "downloads", "occupied");

    const std::string name = "a.txt";
    EXPECT_EQ(status(postStart(SENDER, id, &name, "data")), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Completed);
    EXPECT_EQ(readFile(m_dir / "downloads"), "occupied");
}

TEST_F(TransportServerTest, StartOfCanceledTransactionSavesNothing) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    transactions.setStage(TransactionDirection::Inbound, id, TransactionStage::Canceled);

    const std::string name = "a.txt";
    EXPECT_EQ(status(postStart(SENDER, id, &name, "data")), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Canceled);
    EXPECT_FALSE(std::filesystem::exists(m_dir / "downloads" / "a.txt"));
}

TEST_F(TransportServerTest, StartRejectsUnknownIdAndCaller) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    const std::string name = "a.txt";

    EXPECT_EQ(status(postStart(SENDER, "not-an-id", &name, "data")), "error");
    EXPECT_EQ(status(postStart("192.0.2.77", id, &name, "data")), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Requested);
}

TEST_F(TransportServerTest, StartWithPlainJsonBodyIsRejected) {
    const std::string id = introduceAndRequest(SENDER, "a.txt");
    const json reply = post(SENDER, "start-transaction", {{"transaction_id", id}});
    EXPECT_EQ(status(reply), "error");
    EXPECT_EQ(transactions.get(TransactionDirection::Inbound, id)->stage, TransactionStage::Requested);
}
