/**
 * @file byte_stream.h
 * @brief Duplex byte stream abstraction the frame codec runs on
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/call_context.h"
#include <cstddef>

namespace ragd {

/**
 * @brief Abstract duplex byte stream with deadline-bounded reads
 *
 * Implemented by SocketStream for Unix domain sockets and by in-memory
 * streams in tests. The codec never touches file descriptors directly.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Read up to len bytes, waiting no later than deadline
     * @return Number of bytes read; 0 means the peer closed the stream.
     *         TIMEOUT when the deadline passes, CANCELLED/DEADLINE_EXCEEDED
     *         when ctx stops the call, IO on socket failure.
     */
    virtual Result<size_t> read_some(char* buf, size_t len,
                                     SteadyTimePoint deadline,
                                     const CallContext& ctx) = 0;

    /**
     * @brief Write the whole buffer or fail
     */
    virtual Error write_all(const char* data, size_t len) = 0;

    /**
     * @brief Close the stream; further reads return EOF or IO errors
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace ragd
