/**
 * @file test_session.cpp
 * @brief Unit tests for the handshake state machine
 */

#include <gtest/gtest.h>
#include "ragd/ipc/session.h"
#include "ragd/logger.h"

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ragd::Logger::init(ragd::LogLevel::ERROR, false);
    }

    void TearDown() override {
        ragd::Logger::shutdown();
    }

    ragd::json good_ack() const {
        return ragd::make_handshake_ack().to_json();
    }
};

// ============================================================================
// Client session
// ============================================================================

TEST_F(SessionTest, HandshakeFrameCarriesProtocolAndClient) {
    ragd::ClientSession session("ragctl");
    auto frame = session.handshake().to_json();

    EXPECT_EQ(frame["type"], "handshake");
    EXPECT_EQ(frame["protocol"], "rag-cli-ipc");
    EXPECT_EQ(frame["version"], 1);
    EXPECT_EQ(frame["client"], "ragctl");
}

TEST_F(SessionTest, EmptyClientIdFallsBackToDefault) {
    ragd::ClientSession session("");
    EXPECT_EQ(session.client_id(), ragd::DEFAULT_CLIENT_ID);
}

TEST_F(SessionTest, RequestsOnlyAfterHandshakeSent) {
    ragd::ClientSession session;
    EXPECT_EQ(session.state(), ragd::SessionState::CONNECTED);
    EXPECT_FALSE(session.can_send_request());

    ASSERT_TRUE(session.mark_handshake_sent().ok());
    EXPECT_EQ(session.state(), ragd::SessionState::HANDSHAKE_SENT);
    EXPECT_TRUE(session.can_send_request());
    EXPECT_FALSE(session.can_trust_responses());
}

TEST_F(SessionTest, HandshakeCannotBeSentTwice) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());
    EXPECT_FALSE(session.mark_handshake_sent().ok());
}

TEST_F(SessionTest, ValidAckActivatesSession) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());

    ragd::Error err = session.accept_ack(good_ack());
    EXPECT_TRUE(err.ok()) << err.to_string();
    EXPECT_EQ(session.state(), ragd::SessionState::ACTIVE);
    EXPECT_TRUE(session.can_trust_responses());
    EXPECT_EQ(session.server_id(), ragd::SERVER_ID);
}

TEST_F(SessionTest, WrongProtocolNameClosesSession) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());

    auto ack = good_ack();
    ack["protocol"] = "other-ipc";
    ragd::Error err = session.accept_ack(ack);

    EXPECT_EQ(err.kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_EQ(session.state(), ragd::SessionState::CLOSED);
    EXPECT_FALSE(session.can_send_request());
}

TEST_F(SessionTest, WrongVersionClosesSession) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());

    auto ack = good_ack();
    ack["version"] = 2;
    EXPECT_EQ(session.accept_ack(ack).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_EQ(session.state(), ragd::SessionState::CLOSED);
}

TEST_F(SessionTest, ErrorResponseInsteadOfAckIsMismatch) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());

    ragd::json refusal = {
        {"type", "response"},
        {"status", 400},
        {"correlation_id", "x"},
        {"body", {{"code", "HANDSHAKE_ERROR"}, {"message", "unsupported protocol version: 9"}}}
    };
    ragd::Error err = session.accept_ack(refusal);
    EXPECT_EQ(err.kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_NE(err.message.find("unsupported protocol version"), std::string::npos);
}

TEST_F(SessionTest, MistypedRefusalIsMismatch) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());

    ragd::json refusal = {{"type", "response"}, {"status", "bad"}, {"body", "nope"}};
    ragd::Error err = session.accept_ack(refusal);
    EXPECT_EQ(err.kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_EQ(err.message, "backend returned status 0");
}

TEST_F(SessionTest, MistypedAckFieldsAreMismatch) {
    ragd::ClientSession numeric_type;
    ASSERT_TRUE(numeric_type.mark_handshake_sent().ok());
    EXPECT_EQ(numeric_type.accept_ack({{"type", 3}}).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);

    ragd::ClientSession numeric_server;
    ASSERT_TRUE(numeric_server.mark_handshake_sent().ok());
    ragd::json ack = good_ack();
    ack["server"] = 5;
    EXPECT_EQ(numeric_server.accept_ack(ack).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_EQ(numeric_server.state(), ragd::SessionState::CLOSED);
}

TEST_F(SessionTest, AckBeforeHandshakeIsRejected) {
    ragd::ClientSession session;
    EXPECT_EQ(session.accept_ack(good_ack()).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_EQ(session.state(), ragd::SessionState::CLOSED);
}

TEST_F(SessionTest, ClosedSessionStaysClosed) {
    ragd::ClientSession session;
    ASSERT_TRUE(session.mark_handshake_sent().ok());
    session.close();

    EXPECT_FALSE(session.accept_ack(good_ack()).ok());
    EXPECT_EQ(session.state(), ragd::SessionState::CLOSED);
}

// ============================================================================
// Server-side validation
// ============================================================================

TEST_F(SessionTest, ServerAcceptsValidHandshake) {
    ragd::HandshakeFrame parsed;
    ragd::ClientSession session("ragctl");
    ragd::Error err = ragd::validate_client_handshake(session.handshake().to_json(), &parsed);

    EXPECT_TRUE(err.ok());
    EXPECT_EQ(parsed.client, "ragctl");
}

TEST_F(SessionTest, ServerRejectsRequestAsFirstFrame) {
    ragd::json request = {{"type", "request"}, {"path", "/v1/query"}, {"correlation_id", "c"}};
    EXPECT_EQ(ragd::validate_client_handshake(request).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
}

TEST_F(SessionTest, ServerRejectsWrongVersion) {
    ragd::HandshakeFrame frame;
    frame.version = 7;
    ragd::Error err = ragd::validate_client_handshake(frame.to_json());
    EXPECT_EQ(err.kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
    EXPECT_NE(err.message.find("7"), std::string::npos);
}

TEST_F(SessionTest, ServerRejectsMissingVersion) {
    ragd::json frame = {{"type", "handshake"}, {"protocol", "rag-cli-ipc"}};
    EXPECT_FALSE(ragd::validate_client_handshake(frame).ok());
}

TEST_F(SessionTest, ServerRejectsMistypedFields) {
    EXPECT_EQ(ragd::validate_client_handshake({{"type", 1}}).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);

    ragd::json frame = {{"type", "handshake"}, {"protocol", "rag-cli-ipc"}, {"version", 1}, {"client", 5}};
    EXPECT_EQ(ragd::validate_client_handshake(frame).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);

    frame["client"] = "ragctl";
    frame["version"] = "1";
    EXPECT_EQ(ragd::validate_client_handshake(frame).kind, ragd::ErrorKind::HANDSHAKE_MISMATCH);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
