/**
 * @file server.cpp
 * @brief IPC server implementation
 */

#include "ragd/ipc/server.h"
#include "ragd/ipc/correlation.h"
#include "ragd/ipc/frame_codec.h"
#include "ragd/ipc/session.h"
#include "ragd/ipc/socket_stream.h"
#include "ragd/logger.h"
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace ragd {

namespace {

std::string correlation_or_generate(const json& frame) {
    if (frame.is_object() && frame.contains("correlation_id") &&
        frame["correlation_id"].is_string() && !frame["correlation_id"].get<std::string>().empty()) {
        return frame["correlation_id"].get<std::string>();
    }
    return generate_uuid_hex();
}

}  // namespace

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter(int max_per_second)
    : max_per_second_(max_per_second)
    , window_start_(SteadyClock::now()) {
}

bool RateLimiter::allow() {
    return allow(SteadyClock::now());
}

bool RateLimiter::allow(SteadyTimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now - window_start_ >= std::chrono::seconds(1)) {
        window_start_ = now;
        count_ = 0;
    }
    if (count_ >= max_per_second_) {
        ++rejected_;
        return false;
    }
    ++count_;
    return true;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    count_ = 0;
    rejected_ = 0;
    window_start_ = SteadyClock::now();
}

size_t RateLimiter::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

// ============================================================================
// JobLaunch
// ============================================================================

JobLaunch JobLaunch::reject(Response response) {
    JobLaunch launch;
    launch.accepted = false;
    launch.rejection = std::move(response);
    return launch;
}

JobLaunch JobLaunch::accept(JobSnapshot initial, JobFunction work) {
    JobLaunch launch;
    launch.accepted = true;
    launch.initial = std::move(initial);
    launch.work = std::move(work);
    return launch;
}

// ============================================================================
// IPCServer lifecycle
// ============================================================================

IPCServer::IPCServer(const std::string& socket_path, int max_requests_per_sec)
    : IPCServer([&]() {
          ServerOptions options;
          options.socket_path = socket_path;
          options.max_requests_per_sec = max_requests_per_sec;
          return options;
      }()) {
}

IPCServer::IPCServer(ServerOptions options)
    : options_(std::move(options))
    , rate_limiter_(options_.max_requests_per_sec) {
}

IPCServer::~IPCServer() {
    stop();
}

bool IPCServer::start() {
    if (running_) {
        return true;
    }

    if (!create_socket()) {
        return false;
    }

    jobs_ = std::make_unique<JobStreamer>(options_.job_queue_capacity);
    rate_limiter_.reset();
    running_ = true;
    accept_thread_ = std::make_unique<std::thread>([this] { accept_loop(); });
    LOG_INFO("IPCServer", "Listening on " + options_.socket_path);
    return true;
}

void IPCServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_fd_ != -1) {
        shutdown(server_fd_, SHUT_RDWR);
    }
    if (accept_thread_ && accept_thread_->joinable()) {
        accept_thread_->join();
    }
    accept_thread_.reset();

    // Streaming connections finish once their job observes the stop request
    if (jobs_) {
        jobs_->request_stop();
    }
    shutdown_connections();
    reap_connections(true);

    if (jobs_) {
        jobs_->stop();
        jobs_.reset();
    }

    cleanup_socket();
    LOG_INFO("IPCServer", "Stopped after serving " + std::to_string(connections_served_.load()) +
             " connections, " + std::to_string(rate_limiter_.rejected()) + " requests rate limited");
}

bool IPCServer::is_running() const {
    return running_;
}

bool IPCServer::is_healthy() const {
    return running_ && server_fd_ != -1;
}

std::string IPCServer::status_line() const {
    if (!running_) {
        return "stopped";
    }
    return std::to_string(active_connections()) + " connections, " +
           std::to_string(active_jobs()) + " jobs";
}

size_t IPCServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t active = 0;
    for (const auto& conn : connections_) {
        if (!conn->done) {
            ++active;
        }
    }
    return active;
}

size_t IPCServer::active_jobs() const {
    return jobs_ ? jobs_->active_jobs() : 0;
}

void IPCServer::register_handler(const std::string& path, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[path] = std::move(handler);
    LOG_DEBUG("IPCServer", "Registered handler for " + path);
}

void IPCServer::register_job_handler(const std::string& path, JobHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    job_handlers_[path] = std::move(handler);
    LOG_DEBUG("IPCServer", "Registered job handler for " + path);
}

// ============================================================================
// Socket setup
// ============================================================================

bool IPCServer::create_socket() {
    namespace fs = std::filesystem;
    const std::string& path = options_.socket_path;

    struct sockaddr_un addr;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        LOG_ERROR("IPCServer", "Invalid socket path: " + path);
        return false;
    }

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("IPCServer", "Failed to create socket directory " + parent.string() + ": " + ec.message());
            return false;
        }
        fs::permissions(parent, fs::perms::owner_all, fs::perm_options::replace, ec);
    }

    // Remove a stale socket left by a previous run
    if (fs::exists(fs::symlink_status(path, ec))) {
        fs::remove(path, ec);
        if (ec) {
            LOG_ERROR("IPCServer", "Unable to remove stale socket at " + path + ": " + ec.message());
            return false;
        }
    }

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ == -1) {
        LOG_ERROR("IPCServer", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("IPCServer", "Failed to bind socket: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, options_.backlog) == -1) {
        LOG_ERROR("IPCServer", "Failed to listen: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return setup_permissions();
}

bool IPCServer::setup_permissions() {
    // Owner only: the backend serves the local user, nobody else
    if (chmod(options_.socket_path.c_str(), 0600) == -1) {
        LOG_WARN("IPCServer", "Failed to set socket permissions: " + std::string(strerror(errno)));
    }
    return true;
}

void IPCServer::cleanup_socket() {
    if (server_fd_ != -1) {
        close(server_fd_);
        server_fd_ = -1;
    }
    std::error_code ec;
    std::filesystem::remove(options_.socket_path, ec);
}

// ============================================================================
// Accept loop
// ============================================================================

void IPCServer::accept_loop() {
    while (running_) {
        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd == -1) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            LOG_ERROR("IPCServer", "Accept failed: " + std::string(strerror(errno)));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        connections_served_++;
        reap_connections(false);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(std::make_unique<Connection>());
        Connection& conn = *connections_.back();
        try {
            conn.thread = std::thread([this, client_fd, &conn] {
                try {
                    handle_connection(client_fd, conn);
                } catch (const std::exception& e) {
                    LOG_ERROR("IPCServer", std::string("Connection failed: ") + e.what());
                }
                conn.done = true;
            });
        } catch (const std::system_error& e) {
            LOG_ERROR("IPCServer", std::string("Failed to start connection thread: ") + e.what());
            close(client_fd);
            connections_.pop_back();
        }
    }
}

void IPCServer::reap_connections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (all || (*it)->done) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
}

// Cancels every connection context and wakes writers blocked on a peer
// that stopped reading
void IPCServer::shutdown_connections() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& conn : connections_) {
        conn->ctx.cancel();
        std::lock_guard<std::mutex> stream_lock(conn->stream_mutex);
        if (conn->stream) {
            conn->stream->shutdown();
        }
    }
}

// ============================================================================
// Connection handling
// ============================================================================

namespace {

class StreamRegistration {
public:
    StreamRegistration(std::mutex& mutex, SocketStream*& slot, SocketStream& stream)
        : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = &stream;
    }

    ~StreamRegistration() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = nullptr;
    }

    StreamRegistration(const StreamRegistration&) = delete;
    StreamRegistration& operator=(const StreamRegistration&) = delete;

private:
    std::mutex& mutex_;
    SocketStream*& slot_;
};

}  // namespace

void IPCServer::handle_connection(int fd, Connection& conn) {
    SocketStream stream(fd);
    StreamRegistration registration(conn.stream_mutex, conn.stream, stream);
    FrameReader reader(stream, options_.max_frame_size);
    FrameWriter writer(stream, options_.max_frame_size);

    if (!handshake(reader, writer, conn.ctx)) {
        return;
    }

    while (running_) {
        SteadyTimePoint deadline = options_.idle_timeout.count() > 0
            ? SteadyClock::now() + options_.idle_timeout
            : SteadyTimePoint::max();

        auto frame = reader.read_json(deadline, conn.ctx);
        if (!frame.ok()) {
            switch (frame.error.kind) {
                case ErrorKind::CONNECTION_CLOSED:
                case ErrorKind::CANCELLED:
                    break;
                case ErrorKind::PROTOCOL:
                case ErrorKind::FRAME_TOO_LARGE:
                    LOG_WARN("IPCServer", "Invalid frame: " + frame.error.to_string());
                    send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::INVALID_FRAME,
                                               frame.error.message),
                         generate_uuid_hex());
                    break;
                default:
                    LOG_DEBUG("IPCServer", "Closing connection: " + frame.error.to_string());
                    break;
            }
            return;
        }

        if (!serve_request(frame.value, writer)) {
            return;
        }
    }
}

bool IPCServer::handshake(FrameReader& reader, FrameWriter& writer, const CallContext& ctx) {
    auto frame = reader.read_json(SteadyClock::now() + options_.read_timeout, ctx);
    if (!frame.ok()) {
        if (frame.error.kind == ErrorKind::PROTOCOL || frame.error.kind == ErrorKind::FRAME_TOO_LARGE) {
            send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::HANDSHAKE_ERROR,
                                       frame.error.message),
                 generate_uuid_hex());
        }
        LOG_DEBUG("IPCServer", "Handshake read failed: " + frame.error.to_string());
        return false;
    }

    HandshakeFrame hello;
    Error err = validate_client_handshake(frame.value, &hello);
    if (!err.ok()) {
        LOG_WARN("IPCServer", "Rejected handshake: " + err.message);
        send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::HANDSHAKE_ERROR, err.message),
             correlation_or_generate(frame.value));
        return false;
    }

    err = writer.write_frame(make_handshake_ack().to_json());
    if (!err.ok()) {
        LOG_DEBUG("IPCServer", "Failed to acknowledge handshake: " + err.to_string());
        return false;
    }
    LOG_DEBUG("IPCServer", "Client connected: " + hello.client);
    return true;
}

bool IPCServer::send(FrameWriter& writer, const Response& resp, const std::string& correlation_id) {
    Error err = writer.write_frame(resp.to_frame(correlation_id).to_json());
    if (!err.ok()) {
        LOG_DEBUG("IPCServer", "Failed to write response: " + err.to_string());
        return false;
    }
    return true;
}

bool IPCServer::serve_request(const json& frame, FrameWriter& writer) {
    std::string correlation_id = correlation_or_generate(frame);

    std::string type = frame.contains("type") && frame["type"].is_string()
        ? frame["type"].get<std::string>() : "";
    if (type != FrameTypes::REQUEST) {
        return send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::INVALID_FRAME_TYPE,
                                          "expected a request frame, got \"" + type + "\""),
                    correlation_id);
    }

    auto parsed = RequestFrame::parse(frame);
    if (!parsed.ok()) {
        return send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::INVALID_FRAME,
                                          parsed.error.message),
                    correlation_id);
    }

    Request req;
    req.path = parsed.value.path;
    req.body = parsed.value.body;
    req.correlation_id = correlation_id;

    if (req.path.empty()) {
        return send(writer, Response::err(Status::BAD_REQUEST, ErrorCodes::INVALID_PATH,
                                          "request path must not be empty"),
                    correlation_id);
    }

    if (!rate_limiter_.allow()) {
        LOG_TRACED(WARN, "IPCServer", correlation_id, "Rate limit exceeded for " + req.path);
        return send(writer, Response::err(Status::RATE_LIMITED, ErrorCodes::RATE_LIMITED,
                                          "rate limit exceeded",
                                          "retry after a short pause"),
                    correlation_id);
    }

    RequestHandler handler;
    JobHandler job_handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(req.path);
        if (it != handlers_.end()) {
            handler = it->second;
        }
        auto jt = job_handlers_.find(req.path);
        if (jt != job_handlers_.end()) {
            job_handler = jt->second;
        }
    }

    if (job_handler) {
        return serve_job(req, job_handler, writer);
    }
    if (!handler) {
        return send(writer, Response::err(Status::NOT_FOUND, ErrorCodes::NOT_FOUND,
                                          "no handler for " + req.path),
                    correlation_id);
    }

    Response resp = dispatch(req, handler);
    LOG_TRACED(DEBUG, "IPCServer", correlation_id, req.path + " -> " + std::to_string(resp.status));
    return send(writer, resp, correlation_id);
}

Response IPCServer::dispatch(const Request& req, const RequestHandler& handler) {
    try {
        return handler(req);
    } catch (const std::exception& e) {
        LOG_TRACED(ERROR, "IPCServer", req.correlation_id, "Handler for " + req.path + " failed: " + e.what());
        return Response::err(Status::INTERNAL_ERROR, ErrorCodes::INTERNAL_ERROR, e.what());
    }
}

bool IPCServer::serve_job(const Request& req, const JobHandler& handler, FrameWriter& writer) {
    JobLaunch launch;
    try {
        launch = handler(req);
    } catch (const std::exception& e) {
        LOG_ERROR("IPCServer", "Job handler for " + req.path + " failed: " + e.what());
        return send(writer, Response::err(Status::INTERNAL_ERROR, ErrorCodes::INTERNAL_ERROR, e.what()),
                    req.correlation_id);
    }

    if (!launch.accepted) {
        return send(writer, launch.rejection, req.correlation_id);
    }

    bool stream = req.body.contains("stream") && req.body["stream"].is_boolean() &&
                  req.body["stream"].get<bool>();

    if (!stream) {
        if (!jobs_->launch(launch.initial, launch.work)) {
            return send(writer, Response::err(Status::UNAVAILABLE, ErrorCodes::BACKEND_UNAVAILABLE,
                                              "server is shutting down"),
                        req.correlation_id);
        }
        LOG_INFO("IPCServer", "Started job " + launch.initial.job_id + " for " + req.path);
        return send(writer, Response::ok({{"job", launch.initial.to_json()}}, Status::ACCEPTED),
                    req.correlation_id);
    }

    LOG_INFO("IPCServer", "Streaming job " + launch.initial.job_id + " for " + req.path);
    jobs_->run(launch.initial, launch.work, [&](const JobSnapshot& snap) {
        Response frame = Response::ok({{"job", snap.to_json()}}, Status::ACCEPTED);
        return writer.write_frame(frame.to_frame(req.correlation_id).to_json());
    });

    // The stream owns the connection until its terminal snapshot
    return false;
}

} // namespace ragd
