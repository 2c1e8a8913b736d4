/**
 * @file scripted_stream.h
 * @brief In-memory ByteStream that replays scripted reads and records writes
 */

#pragma once

#include "ragd/ipc/byte_stream.h"
#include "ragd/ipc/correlation.h"
#include "ragd/ipc/frame_codec.h"
#include "ragd/ipc/protocol.h"
#include "ragd/ipc/session.h"
#include <algorithm>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ragd {
namespace test_support {

/**
 * @brief Replays a fixed sequence of read outcomes
 *
 * Each step is either a chunk of bytes, a read timeout or an end of stream.
 * Once the script runs out, reads report end of stream. Everything written
 * is kept so tests can decode the frames the code under test produced.
 */
class ScriptedStream : public ByteStream {
public:
    enum class StepKind { DATA, TIMEOUT, END };

    struct Step {
        StepKind kind;
        std::string data;
    };

    ScriptedStream& data(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back({StepKind::DATA, bytes});
        return *this;
    }

    // Enqueue a JSON frame in wire form
    ScriptedStream& frame(const json& j) {
        auto encoded = encode_frame(j);
        return data(encoded.value);
    }

    ScriptedStream& timeout() {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back({StepKind::TIMEOUT, ""});
        return *this;
    }

    ScriptedStream& end() {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back({StepKind::END, ""});
        return *this;
    }

    void fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    Result<size_t> read_some(char* buf, size_t len, SteadyTimePoint /*deadline*/,
                             const CallContext& ctx) override {
        Error stop = ctx.err();
        if (!stop.ok()) {
            return Result<size_t>::failure(stop);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        reads_++;
        if (!open_) {
            return Result<size_t>::failure(ErrorKind::IO, "stream closed");
        }
        if (steps_.empty()) {
            return Result<size_t>::success(0);
        }

        Step& step = steps_.front();
        switch (step.kind) {
            case StepKind::TIMEOUT:
                steps_.pop_front();
                return Result<size_t>::failure(ErrorKind::TIMEOUT, "scripted timeout");
            case StepKind::END:
                steps_.pop_front();
                return Result<size_t>::success(0);
            case StepKind::DATA:
            default: {
                size_t n = std::min(len, step.data.size());
                step.data.copy(buf, n);
                step.data.erase(0, n);
                if (step.data.empty()) {
                    steps_.pop_front();
                }
                return Result<size_t>::success(n);
            }
        }
    }

    Error write_all(const char* data, size_t len) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return Error::make(ErrorKind::IO, "stream closed");
        }
        if (fail_writes_) {
            return Error::make(ErrorKind::IO, "scripted write failure");
        }
        written_.append(data, len);
        return Error::none();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::string written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    size_t reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }

    /**
     * @brief Decode every frame written so far
     */
    std::vector<json> written_frames() const {
        std::vector<json> frames;
        std::string rest = written();
        while (!rest.empty()) {
            auto newline = rest.find('\n');
            if (newline == std::string::npos) {
                break;
            }
            auto length = parse_length_prefix(rest.substr(0, newline));
            if (!length.ok() || rest.size() < newline + 1 + length.value + 1) {
                break;
            }
            auto payload = parse_payload(rest.substr(newline + 1, length.value));
            if (payload.ok()) {
                frames.push_back(payload.value);
            }
            rest.erase(0, newline + 1 + length.value + 1);
        }
        return frames;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Step> steps_;
    std::string written_;
    bool open_ = true;
    bool fail_writes_ = false;
    size_t reads_ = 0;
};

/**
 * @brief Random source that fills every byte with the same value
 *
 * Makes correlation tokens predictable: fill 0xab yields "abab...ab".
 */
inline RandomSource fixed_random(unsigned char fill) {
    return [fill](unsigned char* buf, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            buf[i] = fill;
        }
        return true;
    };
}

inline std::string fixed_token(unsigned char fill) {
    std::vector<unsigned char> bytes(CORRELATION_ID_BYTES, fill);
    return to_hex(bytes.data(), bytes.size());
}

inline json ack_frame() {
    return make_handshake_ack().to_json();
}

inline json response_frame(int status, const std::string& correlation_id, const json& body) {
    ResponseFrame frame;
    frame.status = status;
    frame.correlation_id = correlation_id;
    frame.body = body;
    return frame.to_json();
}

}  // namespace test_support
}  // namespace ragd
