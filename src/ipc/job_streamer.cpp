/**
 * @file job_streamer.cpp
 * @brief Job worker and single-writer snapshot streaming
 */

#include "ragd/ipc/job_streamer.h"
#include "ragd/ipc/correlation.h"
#include "ragd/logger.h"
#include <system_error>
#include <thread>

namespace ragd {

// ============================================================================
// JobReporter
// ============================================================================

JobReporter::JobReporter(JobSnapshot initial, Publisher publisher, const std::atomic<bool>& stop_requested)
    : current_(std::move(initial))
    , publisher_(std::move(publisher))
    , stop_requested_(stop_requested) {
}

bool JobReporter::publish(JobSnapshot next) {
    if (!can_transition(current_.status, next.status)) {
        LOG_WARN("JobStreamer", "Job " + current_.job_id + " refused transition " +
                 to_string(current_.status) + " -> " + to_string(next.status));
        return false;
    }
    current_ = std::move(next);
    if (publisher_) {
        publisher_(current_);
    }
    return true;
}

void JobReporter::stage(const std::string& name, std::optional<double> percent, int documents) {
    JobSnapshot next = current_;
    next.status = JobStatus::RUNNING;
    next.stage = name;
    next.documents_processed += documents;
    if (percent) {
        next.percent_complete = percent;
    }
    if (!next.started_at) {
        next.started_at = timestamp_iso();
    }
    publish(std::move(next));
}

void JobReporter::progress(int documents, std::optional<double> percent) {
    JobSnapshot next = current_;
    next.status = JobStatus::RUNNING;
    next.documents_processed += documents;
    if (percent) {
        next.percent_complete = percent;
    }
    publish(std::move(next));
}

void JobReporter::throw_if_cancelled() const {
    if (cancel_requested()) {
        throw JobCancelled();
    }
}

bool JobReporter::finish(JobStatus status, const std::string& stage,
                         const std::optional<std::string>& error_message) {
    JobSnapshot next = current_;
    next.status = status;
    next.stage = stage;
    next.completed_at = timestamp_iso();
    if (status == JobStatus::SUCCEEDED) {
        next.percent_complete = 100.0;
    }
    next.error_message = error_message;
    return publish(std::move(next));
}

// ============================================================================
// JobStreamer
// ============================================================================

JobStreamer::JobStreamer(size_t queue_capacity)
    : queue_capacity_(queue_capacity > 0 ? queue_capacity : DEFAULT_JOB_QUEUE_CAPACITY) {
}

JobStreamer::~JobStreamer() {
    stop();
}

JobSnapshot JobStreamer::make_initial(const std::string& first_stage,
                                      const std::string& source_alias,
                                      const std::string& trigger) {
    JobSnapshot snap;
    snap.job_id = generate_uuid_hex();
    snap.source_alias = source_alias;
    snap.status = JobStatus::RUNNING;
    snap.stage = first_stage;
    snap.percent_complete = 0.0;
    snap.requested_at = timestamp_iso();
    snap.started_at = snap.requested_at;
    snap.trigger = trigger.empty() ? "manual" : trigger;
    return snap;
}

bool JobStreamer::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
        return false;
    }
    ++active_;
    return true;
}

void JobStreamer::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
    idle_cv_.notify_all();
}

size_t JobStreamer::active_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void JobStreamer::execute(JobSnapshot initial, const JobFunction& job,
                          const JobReporter::Publisher& publish) {
    const std::string job_id = initial.job_id;
    JobReporter reporter(std::move(initial), publish, stop_requested_);

    try {
        job(reporter);
        reporter.finish(JobStatus::SUCCEEDED, "completed");
    } catch (const JobCancelled&) {
        LOG_INFO("JobStreamer", "Job " + job_id + " cancelled at stage " + reporter.current().stage);
        reporter.finish(JobStatus::CANCELLED, "cancelled");
    } catch (const std::exception& e) {
        LOG_ERROR("JobStreamer", "Job " + job_id + " failed at stage " +
                  reporter.current().stage + ": " + e.what());
        reporter.finish(JobStatus::FAILED, "failed", std::string(e.what()));
    }
}

JobSnapshot JobStreamer::run(JobSnapshot initial, const JobFunction& job, const SnapshotSink& sink) {
    if (!enter()) {
        initial.status = JobStatus::CANCELLED;
        initial.stage = "cancelled";
        initial.completed_at = timestamp_iso();
        Error err = sink(initial);
        if (!err.ok()) {
            LOG_DEBUG("JobStreamer", "Could not report cancelled job: " + err.to_string());
        }
        return initial;
    }

    BoundedQueue<JobSnapshot> queue(queue_capacity_);
    queue.push(initial);

    std::thread worker;
    try {
        worker = std::thread([this, &queue, &job, initial]() {
            execute(initial, job, [&queue](const JobSnapshot& snap) { queue.push(snap); });
            queue.close();
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("JobStreamer", std::string("Failed to start worker: ") + e.what());
        queue.close();
        leave();
        JobSnapshot failed = initial;
        failed.status = JobStatus::FAILED;
        failed.stage = "failed";
        failed.completed_at = timestamp_iso();
        failed.error_message = std::string("failed to start worker: ") + e.what();
        Error err = sink(failed);
        if (!err.ok()) {
            LOG_DEBUG("JobStreamer", "Could not report failed job: " + err.to_string());
        }
        return failed;
    }

    JobSnapshot last = initial;
    bool client_gone = false;
    size_t written = 0;
    while (auto snap = queue.pop()) {
        last = std::move(*snap);
        if (client_gone) {
            continue;
        }
        Error err = sink(last);
        if (!err.ok()) {
            client_gone = true;
            LOG_WARN("JobStreamer", "Client left job " + last.job_id +
                     " stream; job continues: " + err.to_string());
            continue;
        }
        ++written;
    }

    worker.join();
    leave();

    LOG_INFO("JobStreamer", "Job " + last.job_id + " " + to_string(last.status) +
             " (" + std::to_string(written) + " snapshots written)");
    return last;
}

bool JobStreamer::launch(JobSnapshot initial, JobFunction job) {
    if (!enter()) {
        return false;
    }

    try {
        std::thread([this, initial, job]() {
            execute(initial, job, [](const JobSnapshot& snap) {
                LOG_DEBUG("JobStreamer", "Job " + snap.job_id + " " + to_string(snap.status) +
                          " at " + snap.stage);
            });
            leave();
        }).detach();
    } catch (const std::system_error& e) {
        LOG_ERROR("JobStreamer", std::string("Failed to start worker: ") + e.what());
        leave();
        return false;
    }
    return true;
}

void JobStreamer::request_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stop_requested_.exchange(true)) {
        LOG_INFO("JobStreamer", "Stopping, " + std::to_string(active_) + " jobs active");
    }
}

void JobStreamer::stop() {
    request_stop();
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return active_ == 0; });
}

} // namespace ragd
