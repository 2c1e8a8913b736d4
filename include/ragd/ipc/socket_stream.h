/**
 * @file socket_stream.h
 * @brief Unix domain socket implementation of ByteStream
 */

#pragma once

#include "ragd/ipc/byte_stream.h"
#include <atomic>
#include <memory>
#include <string>

namespace ragd {

/**
 * @brief ByteStream over a connected AF_UNIX socket descriptor
 *
 * Owns the descriptor. Reads poll in short slices so that cancellation of
 * the CallContext is noticed without waiting for the full deadline.
 */
class SocketStream : public ByteStream {
public:
    explicit SocketStream(int fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    /**
     * @brief Connect to a Unix socket, retrying a full backlog until timeout
     */
    static Result<std::unique_ptr<SocketStream>> connect_unix(const std::string& path,
                                                              Duration timeout);

    Result<size_t> read_some(char* buf, size_t len,
                             SteadyTimePoint deadline,
                             const CallContext& ctx) override;
    Error write_all(const char* data, size_t len) override;
    void close() override;
    bool is_open() const override;

    /**
     * @brief Wake up blocked readers without releasing the descriptor
     */
    void shutdown();

    int fd() const { return fd_.load(); }

private:
    std::atomic<int> fd_;
};

/**
 * @brief Resolve the backend socket path
 *
 * Order: explicit override, RAGCLI_SOCKET, $XDG_RUNTIME_DIR/ragcli/backend.sock,
 * /tmp/ragcli-<uid>/backend.sock.
 */
std::string resolve_socket_path(const std::string& override_path = "");

} // namespace ragd
