/**
 * @file test_protocol.cpp
 * @brief Unit tests for IPC frame schemas and endpoint models
 */

#include <gtest/gtest.h>
#include "ragd/ipc/models.h"
#include "ragd/ipc/protocol.h"
#include "ragd/logger.h"

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ragd::Logger::init(ragd::LogLevel::ERROR, false);
    }

    void TearDown() override {
        ragd::Logger::shutdown();
    }
};

// ============================================================================
// Handshake frames
// ============================================================================

TEST_F(ProtocolTest, HandshakeCarriesProtocolIdentity) {
    ragd::HandshakeFrame frame;
    frame.client = "ragctl";
    auto j = frame.to_json();

    EXPECT_EQ(j["type"], "handshake");
    EXPECT_EQ(j["protocol"], "rag-cli-ipc");
    EXPECT_EQ(j["version"], 1);
    EXPECT_EQ(j["client"], "ragctl");
}

TEST_F(ProtocolTest, HandshakeRequiresIntegerVersion) {
    auto result = ragd::HandshakeFrame::parse(
        {{"type", "handshake"}, {"protocol", "rag-cli-ipc"}, {"version", "1"}});
    EXPECT_EQ(result.error.kind, ragd::ErrorKind::PROTOCOL);
}

TEST_F(ProtocolTest, AckParsesServerName) {
    auto result = ragd::HandshakeAckFrame::parse(
        {{"type", "handshake_ack"}, {"protocol", "rag-cli-ipc"}, {"version", 1}, {"server", "rag-backend"}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.server, "rag-backend");
}

TEST_F(ProtocolTest, WrongFrameTypeIsProtocolError) {
    auto result = ragd::HandshakeAckFrame::parse({{"type", "response"}, {"status", 200}});
    EXPECT_EQ(result.error.kind, ragd::ErrorKind::PROTOCOL);
    EXPECT_NE(result.error.message.find("handshake_ack"), std::string::npos);
}

TEST_F(ProtocolTest, NonObjectFrameIsRejected) {
    EXPECT_FALSE(ragd::RequestFrame::parse(ragd::json::array()).ok());
    EXPECT_FALSE(ragd::RequestFrame::parse({{"path", "/v1/query"}}).ok());
}

// ============================================================================
// Request and response frames
// ============================================================================

TEST_F(ProtocolTest, RequestBodyDefaultsToEmptyObject) {
    auto result = ragd::RequestFrame::parse({{"type", "request"}, {"path", "/v1/sources"}, {"body", 42}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.path, "/v1/sources");
    EXPECT_TRUE(result.value.correlation_id.empty());
    EXPECT_TRUE(result.value.body.is_object());
    EXPECT_TRUE(result.value.body.empty());
}

TEST_F(ProtocolTest, ResponseNeedsStatusAndCorrelationId) {
    EXPECT_FALSE(ragd::ResponseFrame::parse({{"type", "response"}, {"correlation_id", "c"}}).ok());
    EXPECT_FALSE(ragd::ResponseFrame::parse({{"type", "response"}, {"status", 200}}).ok());

    auto result = ragd::ResponseFrame::parse(
        {{"type", "response"}, {"status", 202}, {"correlation_id", "c"}, {"body", {{"job", {}}}}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.status, 202);
    EXPECT_TRUE(result.value.body.contains("job"));
}

TEST_F(ProtocolTest, ErrorResponseBody) {
    auto resp = ragd::Response::err(ragd::Status::UNAVAILABLE, ragd::ErrorCodes::BACKEND_UNAVAILABLE,
                                    "ollama down", "start ollama");
    EXPECT_FALSE(resp.success());
    EXPECT_EQ(resp.body["code"], "BACKEND_UNAVAILABLE");
    EXPECT_EQ(resp.body["remediation"], "start ollama");

    auto frame = resp.to_frame("cid-9").to_json();
    EXPECT_EQ(frame["type"], "response");
    EXPECT_EQ(frame["correlation_id"], "cid-9");
    EXPECT_EQ(frame["status"], 503);

    EXPECT_FALSE(ragd::Response::err(400, "INVALID_REQUEST", "x").body.contains("remediation"));
}

TEST_F(ProtocolTest, DescribeErrorBody) {
    EXPECT_EQ(ragd::describe_error_body(404, {{"code", "NOT_FOUND"}, {"message", "no handler"}}),
              "backend returned status 404 NOT_FOUND: no handler");
    EXPECT_EQ(ragd::describe_error_body(500, ragd::json()), "backend returned status 500");
}

TEST_F(ProtocolTest, SuccessRange) {
    EXPECT_TRUE(ragd::Status::is_success(200));
    EXPECT_TRUE(ragd::Status::is_success(202));
    EXPECT_FALSE(ragd::Status::is_success(300));
    EXPECT_FALSE(ragd::Status::is_success(429));
}

// ============================================================================
// Endpoint models
// ============================================================================

TEST_F(ProtocolTest, QueryRequestIsNormalized) {
    auto result = ragd::QueryRequest::from_json(
        {{"question", "  restart nginx  "}, {"max_context_tokens", -5}, {"trace_id", " t "}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.question, "restart nginx");
    EXPECT_EQ(result.value.max_context_tokens, ragd::DEFAULT_MAX_CONTEXT_TOKENS);
    EXPECT_EQ(result.value.trace_id, "t");

    EXPECT_EQ(ragd::QueryRequest::from_json({{"question", ""}}).error.kind,
              ragd::ErrorKind::INVALID_ARGUMENT);
}

TEST_F(ProtocolTest, QueryResponseRequiresSummary) {
    EXPECT_EQ(ragd::QueryResponse::from_json({{"summary", "  "}}).error.kind, ragd::ErrorKind::DECODE);

    auto result = ragd::QueryResponse::from_json({
        {"summary", "Use systemctl."},
        {"steps", {"a", 3, "b"}},
        {"citations", {{{"alias", "man-pages"}, {"document_ref", "nginx.8:2"}}}},
        {"confidence", 0.7},
        {"index_version", "catalog/v2"}
    });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.steps, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(result.value.citations.size(), 1u);
    EXPECT_EQ(result.value.citations[0].alias, "man-pages");
    EXPECT_EQ(result.value.index_version.value_or(""), "catalog/v2");
    EXPECT_FALSE(result.value.answer.has_value());
    EXPECT_FALSE(result.value.no_answer);
}

TEST_F(ProtocolTest, ReindexRequestDefaults) {
    auto req = ragd::ReindexRequest::from_json({{"trigger", "  "}});
    EXPECT_EQ(req.trigger, "manual");
    EXPECT_FALSE(req.stream);

    ragd::ReindexRequest streamed;
    streamed.stream = true;
    EXPECT_EQ(streamed.to_json()["stream"], true);
    EXPECT_FALSE(ragd::ReindexRequest{}.to_json().contains("stream"));
}

TEST_F(ProtocolTest, JobBodyNeedsJobMember) {
    EXPECT_EQ(ragd::decode_job_body({{"status", "running"}}).error.kind, ragd::ErrorKind::DECODE);
}

TEST_F(ProtocolTest, HealthMetricsKeepOnlyNumbers) {
    auto result = ragd::HealthResult::from_json({
        {"component", "disk_capacity"},
        {"status", "warn"},
        {"metrics", {{"percent_free", 9.5}, {"mount", "/"}}}
    });
    EXPECT_EQ(result.component, "disk_capacity");
    ASSERT_EQ(result.metrics.size(), 1u);
    EXPECT_DOUBLE_EQ(result.metrics.at("percent_free"), 9.5);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
