/**
 * @file frame_codec.h
 * @brief Length-prefixed JSON framing: "<decimal length>\n<payload>\n"
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/byte_stream.h"
#include <string>

namespace ragd {

/**
 * @brief Serialize a JSON frame into its wire form
 * @return FRAME_TOO_LARGE if the payload exceeds max_frame_size
 */
Result<std::string> encode_frame(const json& frame, size_t max_frame_size = MAX_FRAME_SIZE);

/**
 * @brief Wrap an already serialized payload in the wire envelope
 */
Result<std::string> encode_payload(const std::string& payload, size_t max_frame_size = MAX_FRAME_SIZE);

/**
 * @brief Validate a length line (without its newline)
 *
 * Surrounding blanks are ignored. Anything other than an optional sign
 * followed by decimal digits is PROTOCOL; a negative value is PROTOCOL;
 * a value above max_frame_size is FRAME_TOO_LARGE.
 */
Result<size_t> parse_length_prefix(const std::string& line, size_t max_frame_size = MAX_FRAME_SIZE);

/**
 * @brief Parse a frame payload as a JSON object
 */
Result<json> parse_payload(const std::string& payload);

/**
 * @brief Incremental frame decoder over a ByteStream
 *
 * Bytes are only consumed from the internal buffer once a complete frame
 * has been validated, so a read that times out midway can be retried and
 * resumes where it stopped instead of losing the partial frame.
 */
class FrameReader {
public:
    explicit FrameReader(ByteStream& stream, size_t max_frame_size = MAX_FRAME_SIZE);

    /**
     * @brief Read exactly one frame payload
     *
     * CONNECTION_CLOSED when the stream ends on a frame boundary,
     * UNEXPECTED_EOF when it ends inside a frame, TIMEOUT when the
     * deadline passes first. Malformed framing is PROTOCOL or
     * FRAME_TOO_LARGE and is never worth retrying.
     */
    Result<std::string> read_frame(SteadyTimePoint deadline, const CallContext& ctx);

    /**
     * @brief Read one frame and parse it as a JSON object
     */
    Result<json> read_json(SteadyTimePoint deadline, const CallContext& ctx);

    size_t buffered() const { return buffer_.size(); }

private:
    ByteStream& stream_;
    size_t max_frame_size_;
    std::string buffer_;

    Result<size_t> fill(SteadyTimePoint deadline, const CallContext& ctx);
};

/**
 * @brief Encodes frames and writes them to a ByteStream
 */
class FrameWriter {
public:
    explicit FrameWriter(ByteStream& stream, size_t max_frame_size = MAX_FRAME_SIZE);

    Error write_frame(const json& frame);

private:
    ByteStream& stream_;
    size_t max_frame_size_;
};

} // namespace ragd
