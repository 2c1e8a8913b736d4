/**
 * @file server.h
 * @brief Unix socket server speaking the framed IPC protocol
 */

#pragma once

#include "ragd/common.h"
#include "ragd/core/service.h"
#include "ragd/ipc/call_context.h"
#include "ragd/ipc/job_streamer.h"
#include "ragd/ipc/protocol.h"
#include <atomic>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ragd {

class FrameReader;
class FrameWriter;
class SocketStream;

/**
 * @brief Fixed one-second window request limiter
 */
class RateLimiter {
public:
    explicit RateLimiter(int max_per_second);

    /**
     * @brief Count one request; false once the window's budget is spent
     */
    bool allow();

    /**
     * @brief allow() at an explicit instant; a new window opens one second
     *        after the current one started
     */
    bool allow(SteadyTimePoint now);

    void reset();

    /**
     * @brief Requests refused since construction or the last reset()
     */
    size_t rejected() const;

private:
    int max_per_second_;
    int count_ = 0;
    size_t rejected_ = 0;
    SteadyTimePoint window_start_;
    mutable std::mutex mutex_;
};

using RequestHandler = std::function<Response(const Request&)>;

/**
 * @brief Outcome of a job handler: either a rejection or a job to run
 */
struct JobLaunch {
    bool accepted = false;
    Response rejection;
    JobSnapshot initial;
    JobFunction work;

    static JobLaunch reject(Response response);
    static JobLaunch accept(JobSnapshot initial, JobFunction work);
};

using JobHandler = std::function<JobLaunch(const Request&)>;

struct ServerOptions {
    std::string socket_path;
    int backlog = SOCKET_BACKLOG;
    Duration read_timeout{SOCKET_TIMEOUT_MS};  // Handshake and in-frame reads
    Duration idle_timeout{0};                  // Between requests; 0 waits until stop
    int max_requests_per_sec = MAX_REQUESTS_PER_SECOND;
    size_t job_queue_capacity = DEFAULT_JOB_QUEUE_CAPACITY;
    size_t max_frame_size = MAX_FRAME_SIZE;
};

/**
 * @brief Backend transport server
 *
 * One accept thread plus one thread per connection. Each connection must
 * open with a valid handshake, then carries any number of request frames.
 * Job handlers run their work on a JobStreamer worker; when the request
 * body has "stream": true every snapshot is written back as a 202 frame
 * and the connection is closed after the terminal one, otherwise a single
 * 202 {job} frame is returned and the job continues in the background.
 */
class IPCServer : public Service {
public:
    explicit IPCServer(const std::string& socket_path, int max_requests_per_sec = MAX_REQUESTS_PER_SECOND);
    explicit IPCServer(ServerOptions options);
    ~IPCServer() override;

    IPCServer(const IPCServer&) = delete;
    IPCServer& operator=(const IPCServer&) = delete;

    bool start() override;
    void stop() override;
    const char* name() const override { return "IPCServer"; }
    int priority() const override { return 100; }
    bool is_running() const override;
    bool is_healthy() const override;
    std::string status_line() const override;

    void register_handler(const std::string& path, RequestHandler handler);
    void register_job_handler(const std::string& path, JobHandler handler);

    size_t connections_served() const { return connections_served_.load(); }
    size_t active_connections() const;
    size_t active_jobs() const;

    const std::string& socket_path() const { return options_.socket_path; }

private:
    struct Connection {
        std::thread thread;
        CallContext ctx = CallContext::background();
        std::atomic<bool> done{false};

        // Set while handle_connection owns the socket
        std::mutex stream_mutex;
        SocketStream* stream = nullptr;
    };

    ServerOptions options_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> accept_thread_;
    std::unique_ptr<JobStreamer> jobs_;
    RateLimiter rate_limiter_;

    mutable std::mutex handlers_mutex_;
    std::map<std::string, RequestHandler> handlers_;
    std::map<std::string, JobHandler> job_handlers_;

    mutable std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
    std::atomic<size_t> connections_served_{0};

    bool create_socket();
    bool setup_permissions();
    void cleanup_socket();
    void accept_loop();
    void reap_connections(bool all);
    void shutdown_connections();

    void handle_connection(int fd, Connection& conn);
    bool handshake(FrameReader& reader, FrameWriter& writer, const CallContext& ctx);

    /**
     * @brief Serve one request frame
     * @return false when the connection must be closed afterwards
     */
    bool serve_request(const json& frame, FrameWriter& writer);

    Response dispatch(const Request& req, const RequestHandler& handler);
    bool serve_job(const Request& req, const JobHandler& handler, FrameWriter& writer);
    bool send(FrameWriter& writer, const Response& resp, const std::string& correlation_id);
};

} // namespace ragd
