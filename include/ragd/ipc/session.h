/**
 * @file session.h
 * @brief Per-connection handshake state machine
 */

#pragma once

#include "ragd/ipc/protocol.h"
#include <string>

namespace ragd {

/**
 * @brief Connection lifecycle: Connected -> HandshakeSent -> Active -> Closed
 */
enum class SessionState {
    CONNECTED,
    HANDSHAKE_SENT,
    ACTIVE,
    CLOSED
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::CONNECTED: return "connected";
        case SessionState::HANDSHAKE_SENT: return "handshake_sent";
        case SessionState::ACTIVE: return "active";
        case SessionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Client half of the handshake
 *
 * Requests may be written once the handshake has been sent (the handshake
 * and first request can share the wire), but no response is trusted until
 * accept_ack() has validated the server's acknowledgement. Any mismatch
 * moves the session to CLOSED for good.
 */
class ClientSession {
public:
    explicit ClientSession(std::string client_id = DEFAULT_CLIENT_ID);

    SessionState state() const { return state_; }

    /**
     * @brief Handshake frame to put on the wire
     */
    HandshakeFrame handshake() const;

    /**
     * @brief Connected -> HandshakeSent
     */
    Error mark_handshake_sent();

    bool awaiting_ack() const { return state_ == SessionState::HANDSHAKE_SENT; }

    /**
     * @brief Validate the acknowledgement frame; HandshakeSent -> Active
     *
     * Protocol name and version must match exactly. Anything else returns
     * HANDSHAKE_MISMATCH and closes the session.
     */
    Error accept_ack(const json& frame);

    /**
     * @brief A request frame may be written in HandshakeSent or Active
     */
    bool can_send_request() const;

    /**
     * @brief Responses may only be trusted once Active
     */
    bool can_trust_responses() const { return state_ == SessionState::ACTIVE; }

    void close() { state_ = SessionState::CLOSED; }

    const std::string& client_id() const { return client_id_; }
    const std::string& server_id() const { return server_id_; }

private:
    std::string client_id_;
    std::string server_id_;
    SessionState state_ = SessionState::CONNECTED;

    Error reject(const std::string& message);
};

/**
 * @brief Server-side validation of the first frame on a connection
 * @param out Filled with the parsed handshake when valid
 */
Error validate_client_handshake(const json& frame, HandshakeFrame* out = nullptr);

/**
 * @brief Acknowledgement the server sends back after a valid handshake
 */
HandshakeAckFrame make_handshake_ack(const std::string& server_id = SERVER_ID);

} // namespace ragd
