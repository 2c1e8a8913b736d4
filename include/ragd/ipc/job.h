/**
 * @file job.h
 * @brief Long-running job status machine and progress snapshots
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include <optional>
#include <string>

namespace ragd {

/**
 * @brief Job status; only moves forward queued -> running -> terminal
 */
enum class JobStatus {
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* to_string(JobStatus status);
std::optional<JobStatus> job_status_from_string(const std::string& value);

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::SUCCEEDED ||
           status == JobStatus::FAILED ||
           status == JobStatus::CANCELLED;
}

/**
 * @brief Whether a job may move from one status to another
 *
 * Staying in the same non-terminal status is allowed (progress updates);
 * nothing leaves a terminal status.
 */
bool can_transition(JobStatus from, JobStatus to);

/**
 * @brief Point-in-time progress report, immutable once emitted
 */
struct JobSnapshot {
    std::string job_id;
    std::string source_alias;
    JobStatus status = JobStatus::QUEUED;
    std::string stage;
    std::optional<double> percent_complete;
    int documents_processed = 0;
    std::string requested_at;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> error_message;
    std::string trigger = "manual";

    bool terminal() const { return is_terminal(status); }

    /**
     * @brief Failed, or terminal with an error message regardless of status
     */
    bool failed() const;

    json to_json() const;
    static Result<JobSnapshot> from_json(const json& j);
};

} // namespace ragd
