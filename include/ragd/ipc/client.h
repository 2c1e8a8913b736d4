/**
 * @file client.h
 * @brief Blocking IPC client: handshake, unary calls and job streams
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/byte_stream.h"
#include "ragd/ipc/call_context.h"
#include "ragd/ipc/correlation.h"
#include "ragd/ipc/frame_codec.h"
#include "ragd/ipc/job.h"
#include "ragd/ipc/models.h"
#include "ragd/ipc/protocol.h"
#include "ragd/ipc/retry_policy.h"
#include "ragd/ipc/session.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ragd {

/**
 * @brief Client connection settings
 */
struct ClientConfig {
    std::string socket_path;                     // Empty: resolve_socket_path()
    std::string client_id = DEFAULT_CLIENT_ID;
    Duration dial_timeout{DIAL_TIMEOUT_MS};
    Duration read_timeout{SOCKET_TIMEOUT_MS};    // Per frame read when the call has no deadline; 0 waits
    RetrySchedule retry_schedule;
    RandomSource random = system_random;
    size_t max_frame_size = MAX_FRAME_SIZE;
};

/**
 * @brief Invoked once per streamed snapshot, in arrival order
 *
 * Throwing aborts the stream with a CALLBACK error.
 */
using SnapshotCallback = std::function<void(const JobSnapshot&)>;

/**
 * @brief One connection to the backend
 *
 * Calls are serialized by an internal mutex: a unary call or a full stream
 * holds the connection exclusively. After any fatal error (protocol
 * violation, handshake or correlation mismatch, timeout exhaustion,
 * cancellation mid-read) the connection is marked unusable and every later
 * call fails with CLIENT_CLOSED. Use ClientPool for concurrent callers.
 */
class IPCClient {
public:
    /**
     * @brief Dial the socket and send the handshake
     */
    static Result<std::unique_ptr<IPCClient>> connect(const ClientConfig& config);

    /**
     * @brief Run the protocol over an already connected stream
     */
    static Result<std::unique_ptr<IPCClient>> open(std::unique_ptr<ByteStream> stream,
                                                   const ClientConfig& config);

    ~IPCClient();

    IPCClient(const IPCClient&) = delete;
    IPCClient& operator=(const IPCClient&) = delete;

    /**
     * @brief Send one request and read exactly one response frame
     *
     * Non-success statuses are returned as a frame, not as an error; the
     * typed wrappers below turn them into STATUS errors.
     */
    Result<ResponseFrame> call(const CallContext& ctx, const std::string& path, const json& body);

    /**
     * @brief Send one request and consume job snapshots until a terminal one
     *
     * The returned value is the last snapshot observed, also on error.
     * End of stream before a terminal snapshot is STREAM_INCOMPLETE; a
     * terminal snapshot that failed (including succeeded with an
     * error_message) is a STATUS error. The server closes the connection
     * after a stream, so the client is no longer usable afterwards.
     */
    Result<JobSnapshot> stream(const CallContext& ctx, const std::string& path, const json& body,
                               const SnapshotCallback& on_update);

    // Typed endpoint wrappers
    Result<QueryResponse> query(const CallContext& ctx, QueryRequest request);
    Result<SourceListResponse> list_sources(const CallContext& ctx, const std::string& trace_id = "");
    Result<JobSnapshot> start_reindex(const CallContext& ctx, ReindexRequest request);
    Result<JobSnapshot> start_reindex_stream(const CallContext& ctx, ReindexRequest request,
                                             const SnapshotCallback& on_update);
    Result<InitResponse> init_system(const CallContext& ctx, const std::string& trace_id = "");
    Result<HealthSummary> health_check(const CallContext& ctx, const std::string& trace_id = "");

    /**
     * @brief Whether further calls may be issued on this connection
     */
    bool usable() const;

    SessionState session_state() const;

    void close();

private:
    IPCClient(std::unique_ptr<ByteStream> stream, const ClientConfig& config);

    ClientConfig config_;
    std::unique_ptr<ByteStream> stream_;
    FrameReader reader_;
    FrameWriter writer_;
    ClientSession session_;
    CorrelationGenerator generator_;
    CorrelationTracker tracker_;
    RetryPolicy retry_;

    mutable std::mutex mutex_;
    bool broken_ = false;
    std::string broken_reason_;

    // All below require mutex_ held
    Error send_handshake();
    Error check_usable(const CallContext& ctx) const;
    Error send_request(const std::string& path, const json& body);
    Error consume_handshake_ack(const CallContext& ctx);
    Result<ResponseFrame> read_response(const CallContext& ctx);
    void mark_broken(const Error& err);
};

/**
 * @brief Fixed-size pool handing one exclusive connection to each caller
 *
 * Healthy connections go back to the idle list when a lease ends; broken
 * ones are dropped. The pool must outlive its leases.
 */
class ClientPool {
public:
    using Factory = std::function<Result<std::unique_ptr<IPCClient>>()>;

    class Lease {
    public:
        Lease() = default;
        Lease(ClientPool* pool, std::unique_ptr<IPCClient> client);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        IPCClient* get() const { return client_.get(); }
        IPCClient* operator->() const { return client_.get(); }
        IPCClient& operator*() const { return *client_; }
        explicit operator bool() const { return client_ != nullptr; }

    private:
        ClientPool* pool_ = nullptr;
        std::unique_ptr<IPCClient> client_;

        void release();
    };

    explicit ClientPool(ClientConfig config, size_t max_size = 4);
    ClientPool(Factory factory, size_t max_size);

    /**
     * @brief Take an idle connection, dial a new one, or wait for a release
     */
    Result<Lease> acquire(const CallContext& ctx);

    size_t idle_count() const;
    size_t in_use_count() const;
    size_t max_size() const { return max_size_; }

private:
    Factory factory_;
    size_t max_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<IPCClient>> idle_;
    size_t in_use_ = 0;

    void give_back(std::unique_ptr<IPCClient> client);
};

} // namespace ragd
