/**
 * @file protocol.h
 * @brief Frame schemas, paths, status codes and handler request/response types
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include <string>

namespace ragd {

namespace FrameTypes {
    constexpr const char* HANDSHAKE = "handshake";
    constexpr const char* HANDSHAKE_ACK = "handshake_ack";
    constexpr const char* REQUEST = "request";
    constexpr const char* RESPONSE = "response";
}

namespace Paths {
    constexpr const char* QUERY = "/v1/query";
    constexpr const char* SOURCES = "/v1/sources";
    constexpr const char* INDEX_REINDEX = "/v1/index/reindex";
    constexpr const char* ADMIN_INIT = "/v1/admin/init";
    constexpr const char* ADMIN_HEALTH = "/v1/admin/health";
}

namespace Status {
    constexpr int OK = 200;
    constexpr int CREATED = 201;
    constexpr int ACCEPTED = 202;
    constexpr int BAD_REQUEST = 400;
    constexpr int NOT_FOUND = 404;
    constexpr int RATE_LIMITED = 429;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int UNAVAILABLE = 503;

    inline bool is_success(int status) { return status >= 200 && status < 300; }
}

// Stable error codes carried in error response bodies
namespace ErrorCodes {
    constexpr const char* HANDSHAKE_ERROR = "HANDSHAKE_ERROR";
    constexpr const char* INVALID_FRAME = "INVALID_FRAME";
    constexpr const char* INVALID_FRAME_TYPE = "INVALID_FRAME_TYPE";
    constexpr const char* INVALID_PATH = "INVALID_PATH";
    constexpr const char* NOT_FOUND = "NOT_FOUND";
    constexpr const char* INVALID_REQUEST = "INVALID_REQUEST";
    constexpr const char* RATE_LIMITED = "RATE_LIMITED";
    constexpr const char* INTERNAL_ERROR = "INTERNAL_ERROR";
    constexpr const char* BACKEND_UNAVAILABLE = "BACKEND_UNAVAILABLE";
}

/**
 * @brief Client identification, first frame on every connection
 */
struct HandshakeFrame {
    std::string protocol = PROTOCOL_NAME;
    int version = PROTOCOL_VERSION;
    std::string client = DEFAULT_CLIENT_ID;

    json to_json() const;
    static Result<HandshakeFrame> parse(const json& j);
};

/**
 * @brief Server acknowledgement of the handshake
 */
struct HandshakeAckFrame {
    std::string protocol = PROTOCOL_NAME;
    int version = PROTOCOL_VERSION;
    std::string server = SERVER_ID;

    json to_json() const;
    static Result<HandshakeAckFrame> parse(const json& j);
};

struct RequestFrame {
    std::string path;
    std::string correlation_id;
    json body = json::object();

    json to_json() const;
    static Result<RequestFrame> parse(const json& j);
};

struct ResponseFrame {
    int status = Status::OK;
    std::string correlation_id;
    json body = json::object();

    json to_json() const;
    static Result<ResponseFrame> parse(const json& j);
};

/**
 * @brief Request as seen by a server handler
 */
struct Request {
    std::string path;
    json body = json::object();
    std::string correlation_id;
};

/**
 * @brief Handler result, framed by the server with the request's correlation ID
 */
struct Response {
    int status = Status::OK;
    json body = json::object();

    bool success() const { return Status::is_success(status); }

    ResponseFrame to_frame(const std::string& correlation_id) const;

    static Response ok(json body, int status = Status::OK);
    static Response err(int status, const std::string& code, const std::string& message,
                        const std::string& remediation = "");
};

/**
 * @brief The frame's "type", or "" when it is not an object with a string type
 */
std::string frame_type(const json& frame);

/**
 * @brief Human-readable message from an error body, falling back to the status
 */
std::string describe_error_body(int status, const json& body);

} // namespace ragd
