/**
 * @file job_streamer.h
 * @brief Runs long jobs on a worker thread and streams their snapshots
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/bounded_queue.h"
#include "ragd/ipc/job.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ragd {

/**
 * @brief Thrown by JobReporter::throw_if_cancelled() when shutdown was requested
 */
class JobCancelled : public std::runtime_error {
public:
    JobCancelled() : std::runtime_error("job cancelled") {}
};

/**
 * @brief Handle a job uses to publish progress
 *
 * Every call to stage() or progress() publishes a new immutable snapshot.
 * Status changes that would move backwards are refused.
 */
class JobReporter {
public:
    using Publisher = std::function<void(const JobSnapshot&)>;

    JobReporter(JobSnapshot initial, Publisher publisher, const std::atomic<bool>& stop_requested);

    /**
     * @brief Enter a new phase, adding documents to the processed count
     */
    void stage(const std::string& name, std::optional<double> percent = std::nullopt,
               int documents = 0);

    /**
     * @brief Count processed documents and publish the current phase again
     */
    void progress(int documents, std::optional<double> percent = std::nullopt);

    bool cancel_requested() const { return stop_requested_.load(); }

    void throw_if_cancelled() const;

    const JobSnapshot& current() const { return current_; }

    // Used by the streamer to emit the terminal snapshot
    bool finish(JobStatus status, const std::string& stage,
                const std::optional<std::string>& error_message = std::nullopt);

private:
    JobSnapshot current_;
    Publisher publisher_;
    const std::atomic<bool>& stop_requested_;

    bool publish(JobSnapshot next);
};

/**
 * @brief Work executed on the worker thread
 *
 * Returning normally ends the job as succeeded. Throwing JobCancelled ends
 * it as cancelled; any other exception ends it as failed, with the message
 * as error_message. Side effects already committed are left in place.
 */
using JobFunction = std::function<void(JobReporter&)>;

/**
 * @brief Writes one snapshot to the client; an error means the client is gone
 */
using SnapshotSink = std::function<Error(const JobSnapshot&)>;

/**
 * @brief Producer/consumer job runner
 *
 * The worker publishes snapshots into a bounded queue; the calling thread is
 * the only writer and drains the queue strictly in publish order. If the
 * client disconnects mid-stream the job keeps running to completion and
 * the remaining snapshots are discarded. request_stop() asks every running
 * job to cancel cooperatively.
 */
class JobStreamer {
public:
    explicit JobStreamer(size_t queue_capacity = DEFAULT_JOB_QUEUE_CAPACITY);
    ~JobStreamer();

    JobStreamer(const JobStreamer&) = delete;
    JobStreamer& operator=(const JobStreamer&) = delete;

    /**
     * @brief Initial snapshot for a new job: running, at first_stage
     */
    static JobSnapshot make_initial(const std::string& first_stage,
                                    const std::string& source_alias = "",
                                    const std::string& trigger = "manual");

    /**
     * @brief Run a job and stream every snapshot through sink
     *
     * Blocks until the worker has finished and the queue is drained.
     * The initial snapshot is always the first one written.
     * @return The terminal snapshot
     */
    JobSnapshot run(JobSnapshot initial, const JobFunction& job, const SnapshotSink& sink);

    /**
     * @brief Run a job in the background without a listener
     * @return false when the streamer is stopping
     */
    bool launch(JobSnapshot initial, JobFunction job);

    /**
     * @brief Ask running jobs to cancel and refuse new ones, without waiting
     */
    void request_stop();

    /**
     * @brief Request cooperative cancellation and wait for all jobs to end
     */
    void stop();

    bool stopping() const { return stop_requested_.load(); }
    size_t active_jobs() const;

private:
    size_t queue_capacity_;
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;

    bool enter();
    void leave();
    void execute(JobSnapshot initial, const JobFunction& job, const JobReporter::Publisher& publish);
};

} // namespace ragd
