/**
 * @file session.cpp
 * @brief Handshake state machine implementation
 */

#include "ragd/ipc/session.h"
#include "ragd/logger.h"

namespace ragd {

ClientSession::ClientSession(std::string client_id)
    : client_id_(std::move(client_id)) {
    if (client_id_.empty()) {
        client_id_ = DEFAULT_CLIENT_ID;
    }
}

HandshakeFrame ClientSession::handshake() const {
    HandshakeFrame frame;
    frame.protocol = PROTOCOL_NAME;
    frame.version = PROTOCOL_VERSION;
    frame.client = client_id_;
    return frame;
}

Error ClientSession::mark_handshake_sent() {
    if (state_ != SessionState::CONNECTED) {
        return Error::make(ErrorKind::PROTOCOL,
                           std::string("handshake already sent (state ") + to_string(state_) + ")");
    }
    state_ = SessionState::HANDSHAKE_SENT;
    return Error::none();
}

bool ClientSession::can_send_request() const {
    return state_ == SessionState::HANDSHAKE_SENT || state_ == SessionState::ACTIVE;
}

Error ClientSession::reject(const std::string& message) {
    state_ = SessionState::CLOSED;
    LOG_ERROR("Session", "Handshake rejected: " + message);
    return Error::make(ErrorKind::HANDSHAKE_MISMATCH, message);
}

Error ClientSession::accept_ack(const json& frame) {
    if (state_ != SessionState::HANDSHAKE_SENT) {
        return reject(std::string("unexpected handshake acknowledgement in state ") + to_string(state_));
    }

    // A server that refuses the handshake answers with an error response
    if (frame_type(frame) == FrameTypes::RESPONSE) {
        int status = 0;
        if (frame.contains("status") && frame["status"].is_number_integer()) {
            status = frame["status"].get<int>();
        }
        json body = frame.contains("body") ? frame["body"] : json::object();
        return reject(describe_error_body(status, body));
    }

    auto ack = HandshakeAckFrame::parse(frame);
    if (!ack.ok()) {
        return reject(ack.error.message);
    }
    if (ack.value.protocol != PROTOCOL_NAME) {
        return reject("server protocol mismatch \"" + ack.value.protocol + "\"");
    }
    if (ack.value.version != PROTOCOL_VERSION) {
        return reject("server protocol version " + std::to_string(ack.value.version) + " unsupported");
    }

    server_id_ = ack.value.server;
    state_ = SessionState::ACTIVE;
    LOG_DEBUG("Session", "Handshake acknowledged by " + server_id_);
    return Error::none();
}

Error validate_client_handshake(const json& frame, HandshakeFrame* out) {
    if (frame_type(frame) != FrameTypes::HANDSHAKE) {
        return Error::make(ErrorKind::HANDSHAKE_MISMATCH, "first frame must be a handshake request");
    }

    auto handshake = HandshakeFrame::parse(frame);
    if (!handshake.ok()) {
        return Error::make(ErrorKind::HANDSHAKE_MISMATCH, handshake.error.message);
    }
    if (handshake.value.protocol != PROTOCOL_NAME) {
        return Error::make(ErrorKind::HANDSHAKE_MISMATCH,
                           "unsupported protocol: \"" + handshake.value.protocol + "\"");
    }
    if (handshake.value.version != PROTOCOL_VERSION) {
        return Error::make(ErrorKind::HANDSHAKE_MISMATCH,
                           "unsupported protocol version: " + std::to_string(handshake.value.version));
    }

    if (out) {
        *out = std::move(handshake.value);
    }
    return Error::none();
}

HandshakeAckFrame make_handshake_ack(const std::string& server_id) {
    HandshakeAckFrame ack;
    ack.server = server_id;
    return ack;
}

} // namespace ragd
