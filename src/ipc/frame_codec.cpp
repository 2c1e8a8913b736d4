/**
 * @file frame_codec.cpp
 * @brief Frame codec implementation
 */

#include "ragd/ipc/frame_codec.h"
#include "ragd/logger.h"
#include <cctype>
#include <limits>

namespace ragd {

namespace {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

std::string trim_blanks(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

}  // namespace

Result<std::string> encode_payload(const std::string& payload, size_t max_frame_size) {
    if (payload.size() > max_frame_size) {
        return Result<std::string>::failure(
            ErrorKind::FRAME_TOO_LARGE,
            "frame of " + std::to_string(payload.size()) + " bytes exceeds max frame size " +
            std::to_string(max_frame_size));
    }

    std::string out = std::to_string(payload.size());
    out.reserve(out.size() + payload.size() + 2);
    out += '\n';
    out += payload;
    out += '\n';
    return Result<std::string>::success(std::move(out));
}

Result<std::string> encode_frame(const json& frame, size_t max_frame_size) {
    // Replace invalid UTF-8 instead of throwing from dump()
    std::string payload = frame.dump(-1, ' ', false, json::error_handler_t::replace);
    return encode_payload(payload, max_frame_size);
}

Result<size_t> parse_length_prefix(const std::string& line, size_t max_frame_size) {
    using R = Result<size_t>;

    std::string text = trim_blanks(line);
    if (text.empty()) {
        return R::failure(ErrorKind::PROTOCOL, "invalid length prefix: empty line");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos == text.size()) {
        return R::failure(ErrorKind::PROTOCOL, "invalid length prefix \"" + text + "\"");
    }

    unsigned long long value = 0;
    bool overflow = false;
    for (size_t i = pos; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return R::failure(ErrorKind::PROTOCOL, "invalid length prefix \"" + text + "\"");
        }
        unsigned long long digit = c - '0';
        if (value > (std::numeric_limits<unsigned long long>::max() - digit) / 10) {
            overflow = true;
            break;
        }
        value = value * 10 + digit;
    }

    if (negative && (value != 0 || overflow)) {
        return R::failure(ErrorKind::PROTOCOL, "invalid length prefix " + text + ": negative length");
    }
    if (overflow || value > max_frame_size) {
        return R::failure(ErrorKind::FRAME_TOO_LARGE,
                          "invalid length prefix " + text + ": exceeds max frame size");
    }
    return R::success(static_cast<size_t>(value));
}

Result<json> parse_payload(const std::string& payload) {
    try {
        json parsed = json::parse(payload);
        if (!parsed.is_object()) {
            return Result<json>::failure(ErrorKind::PROTOCOL, "frame payload is not a JSON object");
        }
        return Result<json>::success(std::move(parsed));
    } catch (const json::exception& e) {
        return Result<json>::failure(ErrorKind::PROTOCOL,
                                     "frame payload is not valid JSON: " + std::string(e.what()));
    }
}

FrameReader::FrameReader(ByteStream& stream, size_t max_frame_size)
    : stream_(stream)
    , max_frame_size_(max_frame_size) {
}

Result<size_t> FrameReader::fill(SteadyTimePoint deadline, const CallContext& ctx) {
    char chunk[READ_CHUNK_SIZE];
    auto got = stream_.read_some(chunk, sizeof(chunk), deadline, ctx);
    if (got.ok() && got.value > 0) {
        buffer_.append(chunk, got.value);
    }
    return got;
}

Result<std::string> FrameReader::read_frame(SteadyTimePoint deadline, const CallContext& ctx) {
    using R = Result<std::string>;

    size_t newline = buffer_.find('\n');
    while (newline == std::string::npos) {
        if (buffer_.size() > MAX_LENGTH_PREFIX_DIGITS) {
            return R::failure(ErrorKind::PROTOCOL, "malformed length line");
        }
        auto got = fill(deadline, ctx);
        if (!got.ok()) {
            return R::failure(got.error);
        }
        if (got.value == 0) {
            if (buffer_.empty()) {
                return R::failure(ErrorKind::CONNECTION_CLOSED, "end of stream");
            }
            return R::failure(ErrorKind::UNEXPECTED_EOF, "stream ended inside length line");
        }
        newline = buffer_.find('\n');
    }
    if (newline > MAX_LENGTH_PREFIX_DIGITS) {
        return R::failure(ErrorKind::PROTOCOL, "malformed length line");
    }

    auto length = parse_length_prefix(buffer_.substr(0, newline), max_frame_size_);
    if (!length.ok()) {
        LOG_WARN("FrameCodec", length.error.message);
        return R::failure(length.error);
    }

    const size_t payload_start = newline + 1;
    const size_t frame_end = payload_start + length.value + 1;
    while (buffer_.size() < frame_end) {
        auto got = fill(deadline, ctx);
        if (!got.ok()) {
            return R::failure(got.error);
        }
        if (got.value == 0) {
            return R::failure(ErrorKind::UNEXPECTED_EOF,
                              "stream ended after " + std::to_string(buffer_.size() - payload_start) +
                              " of " + std::to_string(length.value) + " payload bytes");
        }
    }

    char terminator = buffer_[frame_end - 1];
    if (terminator != '\n') {
        LOG_WARN("FrameCodec", "Frame missing newline terminator");
        return R::failure(ErrorKind::PROTOCOL, "expected newline terminator after payload");
    }

    std::string payload = buffer_.substr(payload_start, length.value);
    buffer_.erase(0, frame_end);
    return R::success(std::move(payload));
}

Result<json> FrameReader::read_json(SteadyTimePoint deadline, const CallContext& ctx) {
    auto frame = read_frame(deadline, ctx);
    if (!frame.ok()) {
        return Result<json>::failure(frame.error);
    }
    return parse_payload(frame.value);
}

FrameWriter::FrameWriter(ByteStream& stream, size_t max_frame_size)
    : stream_(stream)
    , max_frame_size_(max_frame_size) {
}

Error FrameWriter::write_frame(const json& frame) {
    auto encoded = encode_frame(frame, max_frame_size_);
    if (!encoded.ok()) {
        return encoded.error;
    }
    return stream_.write_all(encoded.value.data(), encoded.value.size());
}

} // namespace ragd
