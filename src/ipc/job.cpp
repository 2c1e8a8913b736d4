/**
 * @file job.cpp
 * @brief Job status machine and snapshot serialization
 */

#include "ragd/ipc/job.h"

namespace ragd {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED: return "queued";
        case JobStatus::RUNNING: return "running";
        case JobStatus::SUCCEEDED: return "succeeded";
        case JobStatus::FAILED: return "failed";
        case JobStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::optional<JobStatus> job_status_from_string(const std::string& value) {
    if (value == "queued") return JobStatus::QUEUED;
    if (value == "running") return JobStatus::RUNNING;
    if (value == "succeeded") return JobStatus::SUCCEEDED;
    if (value == "failed") return JobStatus::FAILED;
    if (value == "cancelled") return JobStatus::CANCELLED;
    return std::nullopt;
}

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (from == JobStatus::QUEUED) {
        return true;
    }
    // RUNNING
    return to != JobStatus::QUEUED;
}

bool JobSnapshot::failed() const {
    if (status == JobStatus::FAILED) {
        return true;
    }
    return terminal() && error_message && !error_message->empty();
}

json JobSnapshot::to_json() const {
    json j = {
        {"job_id", job_id},
        {"source_alias", source_alias},
        {"status", to_string(status)},
        {"stage", stage},
        {"documents_processed", documents_processed},
        {"requested_at", requested_at},
        {"trigger", trigger}
    };
    j["percent_complete"] = percent_complete ? json(*percent_complete) : json(nullptr);
    j["started_at"] = started_at ? json(*started_at) : json(nullptr);
    j["completed_at"] = completed_at ? json(*completed_at) : json(nullptr);
    j["error_message"] = error_message ? json(*error_message) : json(nullptr);
    return j;
}

Result<JobSnapshot> JobSnapshot::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE, "job snapshot is not an object");
    }
    if (!j.contains("job_id") || !j["job_id"].is_string() || j["job_id"].get<std::string>().empty()) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE, "job snapshot missing job_id");
    }
    if (!j.contains("status") || !j["status"].is_string()) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE, "job snapshot missing status");
    }
    auto status = job_status_from_string(j["status"].get<std::string>());
    if (!status) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE,
            "unknown job status \"" + j["status"].get<std::string>() + "\"");
    }

    JobSnapshot snap;
    try {
        snap.job_id = j["job_id"].get<std::string>();
        snap.status = *status;
        snap.source_alias = j.value("source_alias", "");
        snap.stage = j.value("stage", "");
        snap.documents_processed = j.value("documents_processed", 0);
        snap.requested_at = j.value("requested_at", "");
        snap.trigger = j.value("trigger", "manual");
        if (j.contains("percent_complete") && j["percent_complete"].is_number()) {
            snap.percent_complete = j["percent_complete"].get<double>();
        }
        if (j.contains("started_at") && j["started_at"].is_string()) {
            snap.started_at = j["started_at"].get<std::string>();
        }
        if (j.contains("completed_at") && j["completed_at"].is_string()) {
            snap.completed_at = j["completed_at"].get<std::string>();
        }
        if (j.contains("error_message") && j["error_message"].is_string()) {
            snap.error_message = j["error_message"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE,
            std::string("invalid job snapshot: ") + e.what());
    }
    return Result<JobSnapshot>::success(std::move(snap));
}

} // namespace ragd
