/**
 * @file models.cpp
 * @brief Endpoint body serialization
 */

#include "ragd/ipc/models.h"
#include "ragd/ipc/correlation.h"

namespace ragd {

namespace {

std::string str(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

template <typename T>
T num(const json& j, const char* key, T fallback) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<T>();
    }
    return fallback;
}

const json& array_or_empty(const json& j, const char* key) {
    static const json empty = json::array();
    if (j.contains(key) && j[key].is_array()) {
        return j[key];
    }
    return empty;
}

void put_if(json& j, const char* key, const std::string& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

}  // namespace

std::string trim(const std::string& value) {
    const char* blanks = " \t\r\n";
    auto start = value.find_first_not_of(blanks);
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(blanks);
    return value.substr(start, end - start + 1);
}

std::string ensure_trace_id(const std::string& trace_id) {
    std::string trimmed = trim(trace_id);
    return trimmed.empty() ? new_trace_id() : trimmed;
}

// ============================================================================
// Query
// ============================================================================

Error QueryRequest::normalize() {
    question = trim(question);
    if (question.empty()) {
        return Error::make(ErrorKind::INVALID_ARGUMENT, "question must not be empty");
    }
    conversation_id = trim(conversation_id);
    trace_id = trim(trace_id);
    if (max_context_tokens <= 0) {
        max_context_tokens = DEFAULT_MAX_CONTEXT_TOKENS;
    }
    return Error::none();
}

json QueryRequest::to_json() const {
    json j = {
        {"question", question},
        {"max_context_tokens", max_context_tokens}
    };
    put_if(j, "conversation_id", conversation_id);
    put_if(j, "trace_id", trace_id);
    return j;
}

Result<QueryRequest> QueryRequest::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<QueryRequest>::failure(ErrorKind::DECODE, "query request is not an object");
    }
    QueryRequest req;
    req.question = str(j, "question");
    req.conversation_id = str(j, "conversation_id");
    req.max_context_tokens = num<int>(j, "max_context_tokens", DEFAULT_MAX_CONTEXT_TOKENS);
    req.trace_id = str(j, "trace_id");
    Error err = req.normalize();
    if (!err.ok()) {
        return Result<QueryRequest>::failure(err);
    }
    return Result<QueryRequest>::success(std::move(req));
}

json QueryResponse::to_json() const {
    json refs = json::array();
    for (const auto& ref : references) {
        json r = {{"label", ref.label}};
        put_if(r, "url", ref.url);
        put_if(r, "notes", ref.notes);
        refs.push_back(r);
    }
    json cites = json::array();
    for (const auto& cite : citations) {
        json c = {{"alias", cite.alias}, {"document_ref", cite.document_ref}};
        put_if(c, "excerpt", cite.excerpt);
        cites.push_back(c);
    }

    json j = {
        {"summary", summary},
        {"steps", steps},
        {"references", refs},
        {"citations", cites},
        {"confidence", confidence},
        {"trace_id", trace_id},
        {"latency_ms", latency_ms},
        {"no_answer", no_answer}
    };
    if (retrieval_latency_ms) j["retrieval_latency_ms"] = *retrieval_latency_ms;
    if (llm_latency_ms) j["llm_latency_ms"] = *llm_latency_ms;
    if (index_version) j["index_version"] = *index_version;
    if (answer) j["answer"] = *answer;
    return j;
}

Result<QueryResponse> QueryResponse::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<QueryResponse>::failure(ErrorKind::DECODE, "invalid query response payload");
    }

    QueryResponse resp;
    resp.summary = str(j, "summary");
    if (trim(resp.summary).empty()) {
        return Result<QueryResponse>::failure(ErrorKind::DECODE,
            "invalid query response payload: summary is required");
    }

    for (const auto& step : array_or_empty(j, "steps")) {
        if (step.is_string()) {
            resp.steps.push_back(step.get<std::string>());
        }
    }
    for (const auto& ref : array_or_empty(j, "references")) {
        if (ref.is_object()) {
            resp.references.push_back({str(ref, "label"), str(ref, "url"), str(ref, "notes")});
        }
    }
    for (const auto& cite : array_or_empty(j, "citations")) {
        if (cite.is_object()) {
            resp.citations.push_back({str(cite, "alias"), str(cite, "document_ref"), str(cite, "excerpt")});
        }
    }

    resp.confidence = num<double>(j, "confidence", 0.0);
    resp.trace_id = str(j, "trace_id");
    resp.latency_ms = num<int>(j, "latency_ms", 0);
    if (j.contains("retrieval_latency_ms") && j["retrieval_latency_ms"].is_number()) {
        resp.retrieval_latency_ms = j["retrieval_latency_ms"].get<int>();
    }
    if (j.contains("llm_latency_ms") && j["llm_latency_ms"].is_number()) {
        resp.llm_latency_ms = j["llm_latency_ms"].get<int>();
    }
    if (j.contains("index_version") && j["index_version"].is_string()) {
        resp.index_version = j["index_version"].get<std::string>();
    }
    if (j.contains("answer") && j["answer"].is_string()) {
        resp.answer = j["answer"].get<std::string>();
    }
    resp.no_answer = j.contains("no_answer") && j["no_answer"].is_boolean() && j["no_answer"].get<bool>();
    return Result<QueryResponse>::success(std::move(resp));
}

// ============================================================================
// Sources
// ============================================================================

json SourceRecord::to_json() const {
    json j = {
        {"alias", alias},
        {"type", type},
        {"location", location},
        {"language", language},
        {"size_bytes", size_bytes},
        {"last_updated", last_updated},
        {"status", status}
    };
    put_if(j, "checksum", checksum);
    put_if(j, "notes", notes);
    return j;
}

SourceRecord SourceRecord::from_json(const json& j) {
    SourceRecord rec;
    rec.alias = str(j, "alias");
    rec.type = str(j, "type");
    rec.location = str(j, "location");
    rec.language = str(j, "language");
    rec.size_bytes = num<int64_t>(j, "size_bytes", 0);
    rec.last_updated = str(j, "last_updated");
    rec.status = str(j, "status");
    rec.checksum = str(j, "checksum");
    rec.notes = str(j, "notes");
    return rec;
}

json SourceListResponse::to_json() const {
    json list = json::array();
    for (const auto& src : sources) {
        list.push_back(src.to_json());
    }
    json j = {{"sources", list}, {"updated_at", updated_at}};
    put_if(j, "trace_id", trace_id);
    return j;
}

Result<SourceListResponse> SourceListResponse::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<SourceListResponse>::failure(ErrorKind::DECODE, "decode list response: not an object");
    }
    SourceListResponse resp;
    for (const auto& src : array_or_empty(j, "sources")) {
        if (src.is_object()) {
            resp.sources.push_back(SourceRecord::from_json(src));
        }
    }
    resp.updated_at = str(j, "updated_at");
    resp.trace_id = str(j, "trace_id");
    return Result<SourceListResponse>::success(std::move(resp));
}

// ============================================================================
// Reindex
// ============================================================================

json ReindexRequest::to_json() const {
    json j = {{"trace_id", trace_id}, {"trigger", trigger}};
    if (stream) {
        j["stream"] = true;
    }
    return j;
}

ReindexRequest ReindexRequest::from_json(const json& j) {
    ReindexRequest req;
    req.trace_id = str(j, "trace_id");
    std::string trigger = trim(str(j, "trigger"));
    req.trigger = trigger.empty() ? "manual" : trigger;
    req.stream = j.contains("stream") && j["stream"].is_boolean() && j["stream"].get<bool>();
    return req;
}

Result<JobSnapshot> decode_job_body(const json& body) {
    if (!body.is_object() || !body.contains("job")) {
        return Result<JobSnapshot>::failure(ErrorKind::DECODE, "decode ingestion job: missing 'job'");
    }
    return JobSnapshot::from_json(body["job"]);
}

// ============================================================================
// Admin
// ============================================================================

json DependencyCheck::to_json() const {
    json j = {{"component", component}, {"status", status}, {"message", message}};
    put_if(j, "remediation", remediation);
    return j;
}

DependencyCheck DependencyCheck::from_json(const json& j) {
    return {str(j, "component"), str(j, "status"), str(j, "message"), str(j, "remediation")};
}

json InitResponse::to_json() const {
    json seeded = json::array();
    for (const auto& src : seeded_sources) {
        seeded.push_back(src.to_json());
    }
    json checks = json::array();
    for (const auto& check : dependency_checks) {
        checks.push_back(check.to_json());
    }
    json j = {
        {"catalog_version", catalog_version},
        {"created_directories", created_directories},
        {"seeded_sources", seeded},
        {"dependency_checks", checks}
    };
    put_if(j, "trace_id", trace_id);
    return j;
}

Result<InitResponse> InitResponse::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<InitResponse>::failure(ErrorKind::DECODE, "decode init response: not an object");
    }
    InitResponse resp;
    resp.catalog_version = num<int>(j, "catalog_version", 0);
    for (const auto& dir : array_or_empty(j, "created_directories")) {
        if (dir.is_string()) {
            resp.created_directories.push_back(dir.get<std::string>());
        }
    }
    for (const auto& src : array_or_empty(j, "seeded_sources")) {
        if (src.is_object()) {
            resp.seeded_sources.push_back(SourceRecord::from_json(src));
        }
    }
    for (const auto& check : array_or_empty(j, "dependency_checks")) {
        if (check.is_object()) {
            resp.dependency_checks.push_back(DependencyCheck::from_json(check));
        }
    }
    resp.trace_id = str(j, "trace_id");
    return Result<InitResponse>::success(std::move(resp));
}

json HealthResult::to_json() const {
    json j = {{"component", component}, {"status", status}, {"message", message}};
    put_if(j, "remediation", remediation);
    if (!metrics.empty()) {
        j["metrics"] = metrics;
    }
    return j;
}

HealthResult HealthResult::from_json(const json& j) {
    HealthResult res;
    res.component = str(j, "component");
    res.status = str(j, "status");
    res.message = str(j, "message");
    res.remediation = str(j, "remediation");
    if (j.contains("metrics") && j["metrics"].is_object()) {
        for (auto it = j["metrics"].begin(); it != j["metrics"].end(); ++it) {
            if (it.value().is_number()) {
                res.metrics[it.key()] = it.value().get<double>();
            }
        }
    }
    return res;
}

json HealthSummary::to_json() const {
    json list = json::array();
    for (const auto& res : results) {
        list.push_back(res.to_json());
    }
    return {{"overall_status", overall_status}, {"trace_id", trace_id}, {"results", list}};
}

Result<HealthSummary> HealthSummary::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<HealthSummary>::failure(ErrorKind::DECODE, "decode health summary: not an object");
    }
    HealthSummary summary;
    summary.overall_status = str(j, "overall_status");
    summary.trace_id = str(j, "trace_id");
    for (const auto& res : array_or_empty(j, "results")) {
        if (res.is_object()) {
            summary.results.push_back(HealthResult::from_json(res));
        }
    }
    return Result<HealthSummary>::success(std::move(summary));
}

} // namespace ragd
