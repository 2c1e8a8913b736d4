/**
 * @file protocol.cpp
 * @brief IPC frame schema implementation
 */

#include "ragd/ipc/protocol.h"

namespace ragd {

namespace {

Error envelope_error(const std::string& message) {
    return Error::make(ErrorKind::PROTOCOL, message);
}

bool has_string(const json& j, const char* key) {
    return j.contains(key) && j[key].is_string();
}

bool has_int(const json& j, const char* key) {
    return j.contains(key) && j[key].is_number_integer();
}

Error check_type(const json& j, const char* expected) {
    if (!j.is_object()) {
        return envelope_error("frame is not a JSON object");
    }
    if (!has_string(j, "type")) {
        return envelope_error("frame missing 'type'");
    }
    auto type = j["type"].get<std::string>();
    if (type != expected) {
        return envelope_error("unexpected frame type \"" + type + "\", expected \"" + expected + "\"");
    }
    return Error::none();
}

}  // namespace

json HandshakeFrame::to_json() const {
    return {
        {"type", FrameTypes::HANDSHAKE},
        {"protocol", protocol},
        {"version", version},
        {"client", client}
    };
}

Result<HandshakeFrame> HandshakeFrame::parse(const json& j) {
    Error err = check_type(j, FrameTypes::HANDSHAKE);
    if (!err.ok()) {
        return Result<HandshakeFrame>::failure(err);
    }
    if (!has_string(j, "protocol") || !has_int(j, "version")) {
        return Result<HandshakeFrame>::failure(envelope_error("handshake missing protocol or version"));
    }

    HandshakeFrame frame;
    frame.protocol = j["protocol"].get<std::string>();
    frame.version = j["version"].get<int>();
    if (j.contains("client")) {
        if (!j["client"].is_string()) {
            return Result<HandshakeFrame>::failure(envelope_error("handshake 'client' must be a string"));
        }
        frame.client = j["client"].get<std::string>();
    } else {
        frame.client.clear();
    }
    return Result<HandshakeFrame>::success(std::move(frame));
}

json HandshakeAckFrame::to_json() const {
    return {
        {"type", FrameTypes::HANDSHAKE_ACK},
        {"protocol", protocol},
        {"version", version},
        {"server", server}
    };
}

Result<HandshakeAckFrame> HandshakeAckFrame::parse(const json& j) {
    Error err = check_type(j, FrameTypes::HANDSHAKE_ACK);
    if (!err.ok()) {
        return Result<HandshakeAckFrame>::failure(err);
    }
    if (!has_string(j, "protocol") || !has_int(j, "version")) {
        return Result<HandshakeAckFrame>::failure(
            envelope_error("handshake acknowledgement missing protocol or version"));
    }

    HandshakeAckFrame frame;
    frame.protocol = j["protocol"].get<std::string>();
    frame.version = j["version"].get<int>();
    if (j.contains("server")) {
        if (!j["server"].is_string()) {
            return Result<HandshakeAckFrame>::failure(
                envelope_error("handshake acknowledgement 'server' must be a string"));
        }
        frame.server = j["server"].get<std::string>();
    } else {
        frame.server.clear();
    }
    return Result<HandshakeAckFrame>::success(std::move(frame));
}

json RequestFrame::to_json() const {
    return {
        {"type", FrameTypes::REQUEST},
        {"path", path},
        {"correlation_id", correlation_id},
        {"body", body}
    };
}

Result<RequestFrame> RequestFrame::parse(const json& j) {
    Error err = check_type(j, FrameTypes::REQUEST);
    if (!err.ok()) {
        return Result<RequestFrame>::failure(err);
    }

    RequestFrame frame;
    if (has_string(j, "path")) {
        frame.path = j["path"].get<std::string>();
    }
    if (has_string(j, "correlation_id")) {
        frame.correlation_id = j["correlation_id"].get<std::string>();
    }
    if (j.contains("body") && j["body"].is_object()) {
        frame.body = j["body"];
    }
    return Result<RequestFrame>::success(std::move(frame));
}

json ResponseFrame::to_json() const {
    return {
        {"type", FrameTypes::RESPONSE},
        {"status", status},
        {"correlation_id", correlation_id},
        {"body", body}
    };
}

Result<ResponseFrame> ResponseFrame::parse(const json& j) {
    Error err = check_type(j, FrameTypes::RESPONSE);
    if (!err.ok()) {
        return Result<ResponseFrame>::failure(err);
    }
    if (!has_int(j, "status")) {
        return Result<ResponseFrame>::failure(envelope_error("response missing integer 'status'"));
    }
    if (!has_string(j, "correlation_id")) {
        return Result<ResponseFrame>::failure(envelope_error("response missing 'correlation_id'"));
    }

    ResponseFrame frame;
    frame.status = j["status"].get<int>();
    frame.correlation_id = j["correlation_id"].get<std::string>();
    if (j.contains("body") && !j["body"].is_null()) {
        frame.body = j["body"];
    }
    return Result<ResponseFrame>::success(std::move(frame));
}

ResponseFrame Response::to_frame(const std::string& correlation_id) const {
    ResponseFrame frame;
    frame.status = status;
    frame.correlation_id = correlation_id;
    frame.body = body;
    return frame;
}

Response Response::ok(json body, int status) {
    Response resp;
    resp.status = status;
    resp.body = std::move(body);
    return resp;
}

Response Response::err(int status, const std::string& code, const std::string& message,
                       const std::string& remediation) {
    Response resp;
    resp.status = status;
    resp.body = {
        {"code", code},
        {"message", message}
    };
    if (!remediation.empty()) {
        resp.body["remediation"] = remediation;
    }
    return resp;
}

std::string frame_type(const json& frame) {
    if (!frame.is_object() || !has_string(frame, "type")) {
        return "";
    }
    return frame["type"].get<std::string>();
}

std::string describe_error_body(int status, const json& body) {
    std::string out = "backend returned status " + std::to_string(status);
    if (body.is_object()) {
        if (has_string(body, "code")) {
            out += " " + body["code"].get<std::string>();
        }
        if (has_string(body, "message")) {
            out += ": " + body["message"].get<std::string>();
        }
    }
    return out;
}

} // namespace ragd
