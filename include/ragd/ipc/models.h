/**
 * @file models.h
 * @brief Request and response bodies of the backend endpoints
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/job.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ragd {

struct QueryRequest {
    std::string question;
    std::string conversation_id;
    int max_context_tokens = DEFAULT_MAX_CONTEXT_TOKENS;
    std::string trace_id;

    /**
     * @brief Trim fields and fill defaults; INVALID_ARGUMENT on an empty question
     */
    Error normalize();

    json to_json() const;
    static Result<QueryRequest> from_json(const json& j);
};

struct QueryReference {
    std::string label;
    std::string url;
    std::string notes;
};

struct QueryCitation {
    std::string alias;
    std::string document_ref;
    std::string excerpt;
};

struct QueryResponse {
    std::string summary;
    std::vector<std::string> steps;
    std::vector<QueryReference> references;
    std::vector<QueryCitation> citations;
    double confidence = 0.0;
    std::string trace_id;
    int latency_ms = 0;
    std::optional<int> retrieval_latency_ms;
    std::optional<int> llm_latency_ms;
    std::optional<std::string> index_version;
    std::optional<std::string> answer;
    bool no_answer = false;

    json to_json() const;

    /**
     * @brief Decode a response body; DECODE unless summary is non-empty
     */
    static Result<QueryResponse> from_json(const json& j);
};

struct SourceRecord {
    std::string alias;
    std::string type;
    std::string location;
    std::string language;
    int64_t size_bytes = 0;
    std::string last_updated;
    std::string status;
    std::string checksum;
    std::string notes;

    json to_json() const;
    static SourceRecord from_json(const json& j);
};

struct SourceListResponse {
    std::vector<SourceRecord> sources;
    std::string updated_at;
    std::string trace_id;

    json to_json() const;
    static Result<SourceListResponse> from_json(const json& j);
};

struct ReindexRequest {
    std::string trace_id;
    std::string trigger = "manual";
    bool stream = false;

    json to_json() const;
    static ReindexRequest from_json(const json& j);
};

struct DependencyCheck {
    std::string component;
    std::string status;
    std::string message;
    std::string remediation;

    json to_json() const;
    static DependencyCheck from_json(const json& j);
};

struct InitResponse {
    int catalog_version = 0;
    std::vector<std::string> created_directories;
    std::vector<SourceRecord> seeded_sources;
    std::vector<DependencyCheck> dependency_checks;
    std::string trace_id;

    json to_json() const;
    static Result<InitResponse> from_json(const json& j);
};

struct HealthResult {
    std::string component;
    std::string status;
    std::string message;
    std::string remediation;
    std::map<std::string, double> metrics;

    json to_json() const;
    static HealthResult from_json(const json& j);
};

struct HealthSummary {
    std::string overall_status;
    std::string trace_id;
    std::vector<HealthResult> results;

    json to_json() const;
    static Result<HealthSummary> from_json(const json& j);
};

/**
 * @brief Extract the "job" member of a reindex response body
 */
Result<JobSnapshot> decode_job_body(const json& body);

/**
 * @brief Return trace_id unchanged, or a fresh one if it is blank
 */
std::string ensure_trace_id(const std::string& trace_id);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& value);

} // namespace ragd
