/**
 * @file client.cpp
 * @brief IPC client implementation
 */

#include "ragd/ipc/client.h"
#include "ragd/ipc/socket_stream.h"
#include "ragd/logger.h"
#include <exception>

namespace ragd {

namespace {

template <typename T>
Result<T> failure_with(Error err, T value) {
    auto result = Result<T>::failure(std::move(err));
    result.value = std::move(value);
    return result;
}

Error status_error(const ResponseFrame& frame) {
    return Error::make(ErrorKind::STATUS, describe_error_body(frame.status, frame.body), frame.status);
}

Error unexpected_status(const char* operation, const ResponseFrame& frame) {
    if (!Status::is_success(frame.status)) {
        return status_error(frame);
    }
    return Error::make(ErrorKind::STATUS,
        std::string(operation) + " unexpected status " + std::to_string(frame.status), frame.status);
}

}  // namespace

// ============================================================================
// IPCClient
// ============================================================================

IPCClient::IPCClient(std::unique_ptr<ByteStream> stream, const ClientConfig& config)
    : config_(config)
    , stream_(std::move(stream))
    , reader_(*stream_, config_.max_frame_size)
    , writer_(*stream_, config_.max_frame_size)
    , session_(config_.client_id)
    , generator_(config_.random)
    , tracker_(generator_)
    , retry_(config_.retry_schedule) {
}

IPCClient::~IPCClient() {
    close();
}

Result<std::unique_ptr<IPCClient>> IPCClient::connect(const ClientConfig& config) {
    std::string path = resolve_socket_path(config.socket_path);
    auto dialed = SocketStream::connect_unix(path, config.dial_timeout);
    if (!dialed.ok()) {
        LOG_DEBUG("IPCClient", "Dial " + path + " failed: " + dialed.error.to_string());
        return Result<std::unique_ptr<IPCClient>>::failure(dialed.error);
    }
    LOG_DEBUG("IPCClient", "Connected to " + path);
    return open(std::move(dialed.value), config);
}

Result<std::unique_ptr<IPCClient>> IPCClient::open(std::unique_ptr<ByteStream> stream,
                                                   const ClientConfig& config) {
    if (!stream) {
        return Result<std::unique_ptr<IPCClient>>::failure(ErrorKind::INVALID_ARGUMENT, "no stream");
    }
    std::unique_ptr<IPCClient> client(new IPCClient(std::move(stream), config));

    Error err;
    {
        std::lock_guard<std::mutex> lock(client->mutex_);
        err = client->send_handshake();
    }
    if (!err.ok()) {
        return Result<std::unique_ptr<IPCClient>>::failure(err);
    }
    return Result<std::unique_ptr<IPCClient>>::success(std::move(client));
}

Error IPCClient::send_handshake() {
    Error err = writer_.write_frame(session_.handshake().to_json());
    if (!err.ok()) {
        mark_broken(err);
        return err;
    }
    return session_.mark_handshake_sent();
}

void IPCClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.close();
    if (stream_ && stream_->is_open()) {
        stream_->close();
    }
}

bool IPCClient::usable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !broken_ && session_.can_send_request() && stream_->is_open();
}

SessionState IPCClient::session_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state();
}

void IPCClient::mark_broken(const Error& err) {
    if (!broken_) {
        LOG_WARN("IPCClient", "Connection unusable: " + err.to_string());
    }
    broken_ = true;
    broken_reason_ = err.to_string();
    tracker_.finish();
    session_.close();
    stream_->close();
}

Error IPCClient::check_usable(const CallContext& ctx) const {
    if (broken_) {
        return Error::make(ErrorKind::CLIENT_CLOSED, "connection unusable after " + broken_reason_);
    }
    if (!session_.can_send_request() || !stream_->is_open()) {
        return Error::make(ErrorKind::CLIENT_CLOSED, "connection closed");
    }
    return ctx.err();
}

Error IPCClient::send_request(const std::string& path, const json& body) {
    RequestFrame frame;
    frame.path = path;
    frame.correlation_id = tracker_.begin();
    frame.body = body.is_null() ? json::object() : body;

    Error err = writer_.write_frame(frame.to_json());
    if (!err.ok()) {
        // An oversized request never reached the wire; the connection is intact
        if (err.kind == ErrorKind::FRAME_TOO_LARGE) {
            tracker_.finish();
        } else {
            mark_broken(err);
        }
        return err;
    }
    LOG_DEBUG("IPCClient", "Sent " + path + " [" + frame.correlation_id + "]");
    return Error::none();
}

Error IPCClient::consume_handshake_ack(const CallContext& ctx) {
    if (!session_.awaiting_ack()) {
        return Error::none();
    }

    auto payload = retry_.run(ctx, [&]() {
        return reader_.read_frame(ctx.frame_deadline(config_.read_timeout), ctx);
    });
    if (!payload.ok()) {
        mark_broken(payload.error);
        return payload.error;
    }
    auto frame = parse_payload(payload.value);
    if (!frame.ok()) {
        mark_broken(frame.error);
        return frame.error;
    }
    Error err = session_.accept_ack(frame.value);
    if (!err.ok()) {
        mark_broken(err);
    }
    return err;
}

Result<ResponseFrame> IPCClient::read_response(const CallContext& ctx) {
    auto payload = retry_.run(ctx, [&]() {
        return reader_.read_frame(ctx.frame_deadline(config_.read_timeout), ctx);
    });
    if (!payload.ok()) {
        return Result<ResponseFrame>::failure(payload.error);
    }
    auto parsed = parse_payload(payload.value);
    if (!parsed.ok()) {
        return Result<ResponseFrame>::failure(parsed.error);
    }
    auto frame = ResponseFrame::parse(parsed.value);
    if (!frame.ok()) {
        return frame;
    }
    Error err = tracker_.verify(frame.value.correlation_id);
    if (!err.ok()) {
        return Result<ResponseFrame>::failure(err);
    }
    return frame;
}

Result<ResponseFrame> IPCClient::call(const CallContext& ctx, const std::string& path, const json& body) {
    std::lock_guard<std::mutex> lock(mutex_);

    Error err = check_usable(ctx);
    if (!err.ok()) {
        return Result<ResponseFrame>::failure(err);
    }
    err = send_request(path, body);
    if (!err.ok()) {
        return Result<ResponseFrame>::failure(err);
    }
    err = consume_handshake_ack(ctx);
    if (!err.ok()) {
        return Result<ResponseFrame>::failure(err);
    }

    auto frame = read_response(ctx);
    if (!frame.ok()) {
        mark_broken(frame.error);
        return frame;
    }
    tracker_.finish();
    return frame;
}

Result<JobSnapshot> IPCClient::stream(const CallContext& ctx, const std::string& path, const json& body,
                                      const SnapshotCallback& on_update) {
    std::lock_guard<std::mutex> lock(mutex_);

    Error err = check_usable(ctx);
    if (!err.ok()) {
        return Result<JobSnapshot>::failure(err);
    }
    err = send_request(path, body);
    if (!err.ok()) {
        return Result<JobSnapshot>::failure(err);
    }
    err = consume_handshake_ack(ctx);
    if (!err.ok()) {
        return Result<JobSnapshot>::failure(err);
    }

    JobSnapshot last;
    bool have_snapshot = false;

    while (true) {
        auto frame = read_response(ctx);
        if (!frame.ok()) {
            Error failure = frame.error;
            if (failure.kind == ErrorKind::CONNECTION_CLOSED) {
                failure = Error::make(ErrorKind::STREAM_INCOMPLETE, "stream ended before completion");
            }
            mark_broken(failure);
            return failure_with(failure, last);
        }

        if (!Status::is_success(frame.value.status)) {
            Error failure = status_error(frame.value);
            if (have_snapshot) {
                mark_broken(failure);
            } else {
                tracker_.finish();
            }
            return failure_with(failure, last);
        }

        auto snapshot = decode_job_body(frame.value.body);
        if (!snapshot.ok()) {
            mark_broken(snapshot.error);
            return failure_with(snapshot.error, last);
        }
        if (have_snapshot && !can_transition(last.status, snapshot.value.status)) {
            Error failure = Error::make(ErrorKind::PROTOCOL,
                std::string("job status moved from ") + to_string(last.status) +
                " to " + to_string(snapshot.value.status));
            mark_broken(failure);
            return failure_with(failure, last);
        }

        last = std::move(snapshot.value);
        have_snapshot = true;

        if (on_update) {
            try {
                on_update(last);
            } catch (const std::exception& e) {
                Error failure = Error::make(ErrorKind::CALLBACK, std::string("snapshot callback: ") + e.what());
                if (last.terminal()) {
                    tracker_.finish();
                    session_.close();
                    stream_->close();
                } else {
                    // Remaining frames of this stream are still in flight
                    mark_broken(failure);
                }
                return failure_with(failure, last);
            }
        }

        if (last.terminal()) {
            // The server ends the connection after a job stream
            tracker_.finish();
            session_.close();
            stream_->close();
            if (last.failed()) {
                std::string message = "job reported error";
                if (last.error_message && !last.error_message->empty()) {
                    message += ": " + *last.error_message;
                }
                return failure_with(Error::make(ErrorKind::STATUS, message, frame.value.status), last);
            }
            return Result<JobSnapshot>::success(last);
        }
    }
}

// ============================================================================
// Typed endpoint wrappers
// ============================================================================

Result<QueryResponse> IPCClient::query(const CallContext& ctx, QueryRequest request) {
    Error err = request.normalize();
    if (!err.ok()) {
        return Result<QueryResponse>::failure(err);
    }
    request.trace_id = ensure_trace_id(request.trace_id);

    auto frame = call(ctx, Paths::QUERY, request.to_json());
    if (!frame.ok()) {
        return Result<QueryResponse>::failure(frame.error);
    }
    if (frame.value.status != Status::OK) {
        return Result<QueryResponse>::failure(unexpected_status("query", frame.value));
    }

    auto resp = QueryResponse::from_json(frame.value.body);
    if (resp.ok() && resp.value.trace_id.empty()) {
        resp.value.trace_id = request.trace_id;
    }
    return resp;
}

Result<SourceListResponse> IPCClient::list_sources(const CallContext& ctx, const std::string& trace_id) {
    json body = {{"trace_id", ensure_trace_id(trace_id)}};
    auto frame = call(ctx, Paths::SOURCES, body);
    if (!frame.ok()) {
        return Result<SourceListResponse>::failure(frame.error);
    }
    if (frame.value.status != Status::OK) {
        return Result<SourceListResponse>::failure(unexpected_status("list sources", frame.value));
    }
    return SourceListResponse::from_json(frame.value.body);
}

Result<JobSnapshot> IPCClient::start_reindex(const CallContext& ctx, ReindexRequest request) {
    request.trace_id = ensure_trace_id(request.trace_id);
    request.stream = false;

    auto frame = call(ctx, Paths::INDEX_REINDEX, request.to_json());
    if (!frame.ok()) {
        return Result<JobSnapshot>::failure(frame.error);
    }
    if (frame.value.status != Status::ACCEPTED) {
        return Result<JobSnapshot>::failure(unexpected_status("start reindex", frame.value));
    }
    return decode_job_body(frame.value.body);
}

Result<JobSnapshot> IPCClient::start_reindex_stream(const CallContext& ctx, ReindexRequest request,
                                                    const SnapshotCallback& on_update) {
    request.trace_id = ensure_trace_id(request.trace_id);
    request.trigger = trim(request.trigger).empty() ? "manual" : trim(request.trigger);
    request.stream = true;
    return stream(ctx, Paths::INDEX_REINDEX, request.to_json(), on_update);
}

Result<InitResponse> IPCClient::init_system(const CallContext& ctx, const std::string& trace_id) {
    std::string trace = ensure_trace_id(trace_id);
    auto frame = call(ctx, Paths::ADMIN_INIT, {{"trace_id", trace}});
    if (!frame.ok()) {
        return Result<InitResponse>::failure(frame.error);
    }
    if (frame.value.status != Status::OK) {
        return Result<InitResponse>::failure(unexpected_status("admin init", frame.value));
    }
    auto resp = InitResponse::from_json(frame.value.body);
    if (resp.ok() && resp.value.trace_id.empty()) {
        resp.value.trace_id = trace;
    }
    return resp;
}

Result<HealthSummary> IPCClient::health_check(const CallContext& ctx, const std::string& trace_id) {
    std::string trace = ensure_trace_id(trace_id);
    auto frame = call(ctx, Paths::ADMIN_HEALTH, {{"trace_id", trace}});
    if (!frame.ok()) {
        return Result<HealthSummary>::failure(frame.error);
    }
    if (frame.value.status != Status::OK) {
        return Result<HealthSummary>::failure(unexpected_status("admin health", frame.value));
    }
    auto resp = HealthSummary::from_json(frame.value.body);
    if (resp.ok() && resp.value.trace_id.empty()) {
        resp.value.trace_id = trace;
    }
    return resp;
}

// ============================================================================
// ClientPool
// ============================================================================

ClientPool::Lease::Lease(ClientPool* pool, std::unique_ptr<IPCClient> client)
    : pool_(pool)
    , client_(std::move(client)) {
}

ClientPool::Lease::~Lease() {
    release();
}

ClientPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , client_(std::move(other.client_)) {
    other.pool_ = nullptr;
}

ClientPool::Lease& ClientPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        client_ = std::move(other.client_);
        other.pool_ = nullptr;
    }
    return *this;
}

void ClientPool::Lease::release() {
    if (pool_ && client_) {
        pool_->give_back(std::move(client_));
    }
    pool_ = nullptr;
}

ClientPool::ClientPool(ClientConfig config, size_t max_size)
    : factory_([config]() { return IPCClient::connect(config); })
    , max_size_(max_size > 0 ? max_size : 1) {
}

ClientPool::ClientPool(Factory factory, size_t max_size)
    : factory_(std::move(factory))
    , max_size_(max_size > 0 ? max_size : 1) {
}

Result<ClientPool::Lease> ClientPool::acquire(const CallContext& ctx) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        Error err = ctx.err();
        if (!err.ok()) {
            return Result<Lease>::failure(err);
        }

        while (!idle_.empty()) {
            auto client = std::move(idle_.front());
            idle_.pop_front();
            if (client->usable()) {
                ++in_use_;
                return Result<Lease>::success(Lease(this, std::move(client)));
            }
        }

        if (in_use_ < max_size_) {
            ++in_use_;
            lock.unlock();
            auto dialed = factory_();
            if (!dialed.ok()) {
                lock.lock();
                --in_use_;
                cv_.notify_one();
                return Result<Lease>::failure(dialed.error);
            }
            return Result<Lease>::success(Lease(this, std::move(dialed.value)));
        }

        // Wake periodically so cancellation and deadlines are honored
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
}

void ClientPool::give_back(std::unique_ptr<IPCClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0) {
        --in_use_;
    }
    if (client && client->usable()) {
        idle_.push_back(std::move(client));
    }
    cv_.notify_one();
}

size_t ClientPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ClientPool::in_use_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace ragd
