/**
 * @file handlers.cpp
 * @brief Backend request handler implementations
 */

#include "ragd/core/handlers.h"
#include "ragd/ipc/correlation.h"
#include "ragd/logger.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace ragd {

namespace {

constexpr size_t MAX_CONTEXT_SNIPPETS = 8;
constexpr size_t CHARS_PER_TOKEN = 4;
constexpr size_t PREVIEW_CHARS = 120;
constexpr double DEFAULT_CONFIDENCE = 0.6;
constexpr double NO_INDEX_CONFIDENCE = 0.25;
constexpr double GENERATION_TEMPERATURE = 0.15;

constexpr double DISK_WARN_RATIO = 0.10;
constexpr double DISK_FAIL_RATIO = 0.08;
constexpr int INDEX_WARN_AGE_DAYS = 30;

namespace HealthStatus {
    constexpr const char* PASS = "pass";
    constexpr const char* WARN = "warn";
    constexpr const char* FAIL = "fail";
}

std::string preview(const std::string& text) {
    if (text.size() <= PREVIEW_CHARS) {
        return text;
    }
    return text.substr(0, PREVIEW_CHARS) + "...";
}

int elapsed_ms(SteadyTimePoint since) {
    return static_cast<int>(std::chrono::duration_cast<Duration>(SteadyClock::now() - since).count());
}

std::string body_trace_id(const json& body) {
    if (body.is_object() && body.contains("trace_id") && body["trace_id"].is_string()) {
        return ensure_trace_id(body["trace_id"].get<std::string>());
    }
    return ensure_trace_id("");
}

// Parses the UTC form written by to_iso()
std::optional<TimePoint> from_iso(const std::string& value) {
    std::tm tm{};
    if (strptime(value.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm) == nullptr) {
        return std::nullopt;
    }
    return Clock::from_time_t(timegm(&tm));
}

QueryResponse no_answer_response(const QueryRequest& request, const std::string& summary,
                                 const std::string& notes, int index_version) {
    QueryResponse resp;
    resp.summary = summary;
    resp.steps = {"Run `ragctl reindex` and retry the query."};
    resp.references = {{"Catalog", "", notes}};
    resp.confidence = NO_INDEX_CONFIDENCE;
    resp.trace_id = request.trace_id;
    resp.llm_latency_ms = 0;
    resp.index_version = "catalog/v" + std::to_string(index_version);
    resp.no_answer = true;
    return resp;
}

}  // namespace

// ============================================================================
// OllamaQueryService
// ============================================================================

OllamaQueryService::OllamaQueryService(std::shared_ptr<OllamaClient> ollama, std::string data_dir)
    : ollama_(std::move(ollama))
    , store_(std::move(data_dir)) {
}

std::string OllamaQueryService::render_prompt(const std::string& question,
                                              const std::vector<Snippet>& contexts) {
    std::string context_text;
    for (const auto& snippet : contexts) {
        context_text += "[" + snippet.alias + ":" + snippet.document_ref + "] " + snippet.text + "\n";
    }
    return "You are a local Linux assistant. Use ONLY the provided context to answer the question.\n"
           "Respond as JSON with the following keys: summary (string), steps (array of short instructions),\n"
           "references (array of objects with label and optional notes/url), confidence (0-1 float),\n"
           "and no_answer (boolean). Keep guidance concise and cite the relevant context snippets.\n\n"
           "Context:\n" + context_text + "\nQuestion:\n" + question + "\n\nJSON Response:";
}

Result<QueryResponse> OllamaQueryService::answer(const QueryRequest& request) {
    auto started = SteadyClock::now();

    auto manifest = store_.load_manifest();
    if (!manifest) {
        QueryResponse resp = no_answer_response(request,
            "No content index is available. Run `ragctl reindex` to build the knowledge index.",
            "No indexed snapshots available.", 0);
        resp.latency_ms = elapsed_ms(started);
        resp.retrieval_latency_ms = resp.latency_ms;
        return Result<QueryResponse>::success(std::move(resp));
    }

    size_t max_chars = static_cast<size_t>(request.max_context_tokens) * CHARS_PER_TOKEN;
    auto contexts = store_.search(request.question, MAX_CONTEXT_SNIPPETS, max_chars);
    int retrieval_ms = elapsed_ms(started);

    if (contexts.empty()) {
        QueryResponse resp = no_answer_response(request,
            "No indexed documents matched the question. Run `ragctl reindex` to refresh retrieval context.",
            "No matching snippets.", manifest->catalog_version);
        resp.latency_ms = retrieval_ms;
        resp.retrieval_latency_ms = retrieval_ms;
        return Result<QueryResponse>::success(std::move(resp));
    }

    if (!ollama_) {
        return Result<QueryResponse>::failure(ErrorKind::IO, "no language model configured");
    }

    GenerateOptions options;
    options.temperature = GENERATION_TEMPERATURE;
    options.json_format = true;
    auto completion = ollama_->generate(render_prompt(request.question, contexts), options);
    if (!completion.ok()) {
        LOG_TRACED(WARN, "Handlers", request.trace_id, "Generation failed: " + completion.error.to_string());
        return Result<QueryResponse>::failure(completion.error);
    }

    json parsed = json::object();
    try {
        json candidate = json::parse(completion.value.text);
        if (candidate.is_object()) {
            parsed = std::move(candidate);
        }
    } catch (const json::exception& e) {
        LOG_DEBUG("Handlers", "Completion is not JSON: " + std::string(e.what()));
    }

    QueryResponse resp;
    resp.trace_id = request.trace_id;

    if (parsed.contains("summary") && parsed["summary"].is_string()) {
        resp.summary = trim(parsed["summary"].get<std::string>());
    }
    if (resp.summary.empty()) {
        resp.summary = "Consult the retrieved documents for guidance on '" + request.question + "'.";
    }

    if (parsed.contains("steps") && parsed["steps"].is_array()) {
        for (const auto& step : parsed["steps"]) {
            if (step.is_string() && !trim(step.get<std::string>()).empty()) {
                resp.steps.push_back(trim(step.get<std::string>()));
            }
        }
    } else if (parsed.contains("steps") && parsed["steps"].is_string()) {
        std::string step = trim(parsed["steps"].get<std::string>());
        if (!step.empty()) {
            resp.steps.push_back(step);
        }
    }

    if (parsed.contains("references") && parsed["references"].is_array()) {
        for (const auto& ref : parsed["references"]) {
            if (!ref.is_object()) {
                continue;
            }
            QueryReference reference;
            reference.label = ref.contains("label") && ref["label"].is_string()
                ? ref["label"].get<std::string>() : "";
            if (reference.label.empty()) {
                reference.label = "context";
            }
            if (ref.contains("url") && ref["url"].is_string()) reference.url = ref["url"].get<std::string>();
            if (ref.contains("notes") && ref["notes"].is_string()) reference.notes = ref["notes"].get<std::string>();
            resp.references.push_back(reference);
        }
    }
    if (resp.references.empty()) {
        for (const auto& snippet : contexts) {
            resp.references.push_back({snippet.alias + ":" + snippet.document_ref, "", preview(snippet.text)});
        }
    }
    for (const auto& snippet : contexts) {
        resp.citations.push_back({snippet.alias, snippet.document_ref, preview(snippet.text)});
    }

    resp.confidence = DEFAULT_CONFIDENCE;
    if (parsed.contains("confidence") && parsed["confidence"].is_number()) {
        resp.confidence = std::max(0.0, std::min(1.0, parsed["confidence"].get<double>()));
    }

    if (parsed.contains("answer") && parsed["answer"].is_string()) {
        resp.answer = trim(parsed["answer"].get<std::string>());
    } else {
        resp.answer = resp.summary;
    }
    resp.no_answer = parsed.contains("no_answer") && parsed["no_answer"].is_boolean() &&
                     parsed["no_answer"].get<bool>();

    resp.retrieval_latency_ms = retrieval_ms;
    resp.llm_latency_ms = completion.value.latency_ms;
    resp.latency_ms = retrieval_ms + completion.value.latency_ms;
    resp.index_version = "catalog/v" + std::to_string(manifest->catalog_version);
    return Result<QueryResponse>::success(std::move(resp));
}

// ============================================================================
// Registration
// ============================================================================

void Handlers::register_all(IPCServer& server, HandlerContext context) {
    auto ctx = std::make_shared<HandlerContext>(std::move(context));
    auto store = std::make_shared<SourceStore>(ctx->data_dir);

    server.register_handler(Paths::QUERY, [ctx](const Request& req) {
        return handle_query(req, ctx->query.get());
    });

    server.register_handler(Paths::SOURCES, [store](const Request& req) {
        return handle_sources(req, *store);
    });

    server.register_job_handler(Paths::INDEX_REINDEX, [store](const Request& req) {
        return handle_reindex(req, store);
    });

    server.register_handler(Paths::ADMIN_INIT, [ctx](const Request& req) {
        return handle_init(req, *ctx);
    });

    server.register_handler(Paths::ADMIN_HEALTH, [ctx](const Request& req) {
        return handle_health(req, *ctx);
    });

    LOG_INFO("Handlers", "Registered 5 IPC handlers");
}

// ============================================================================
// Query and sources
// ============================================================================

Response Handlers::handle_query(const Request& req, QueryService* service) {
    auto request = QueryRequest::from_json(req.body);
    if (!request.ok()) {
        return Response::err(Status::BAD_REQUEST, ErrorCodes::INVALID_REQUEST, request.error.message);
    }
    request.value.trace_id = ensure_trace_id(request.value.trace_id);

    if (!service) {
        return Response::err(Status::UNAVAILABLE, ErrorCodes::BACKEND_UNAVAILABLE,
                             "query service is not configured");
    }

    auto result = service->answer(request.value);
    if (!result.ok()) {
        switch (result.error.kind) {
            case ErrorKind::NETWORK_BLOCKED:
                return Response::err(Status::UNAVAILABLE, ErrorCodes::BACKEND_UNAVAILABLE,
                                     result.error.message,
                                     "Point network.ollama_url at a loopback address or disable offline mode.");
            case ErrorKind::IO:
            case ErrorKind::TIMEOUT:
            case ErrorKind::STATUS:
                return Response::err(Status::UNAVAILABLE, ErrorCodes::BACKEND_UNAVAILABLE,
                                     result.error.message,
                                     "Check that Ollama is running and the configured model is pulled.");
            default:
                return Response::err(Status::INTERNAL_ERROR, ErrorCodes::INTERNAL_ERROR,
                                     result.error.message);
        }
    }

    if (trim(result.value.trace_id).empty()) {
        result.value.trace_id = request.value.trace_id;
    }
    return Response::ok(result.value.to_json());
}

Response Handlers::handle_sources(const Request& req, const SourceStore& store) {
    SourceListResponse list;
    for (auto& scan : store.scan()) {
        list.sources.push_back(std::move(scan.record));
    }
    auto manifest = store.load_manifest();
    list.updated_at = manifest ? manifest->built_at : timestamp_iso();
    list.trace_id = body_trace_id(req.body);
    return Response::ok(list.to_json());
}

// ============================================================================
// Reindex
// ============================================================================

JobLaunch Handlers::handle_reindex(const Request& req, std::shared_ptr<const SourceStore> store) {
    auto request = ReindexRequest::from_json(req.body);
    JobSnapshot initial = JobStreamer::make_initial("preparing_index", "*", request.trigger);
    LOG_INFO("Handlers", "Reindex requested (trigger=" + initial.trigger + ", job " + initial.job_id + ")");

    return JobLaunch::accept(std::move(initial), [store](JobReporter& reporter) {
        run_reindex(reporter, *store);
    });
}

void Handlers::run_reindex(JobReporter& reporter, const SourceStore& store) {
    store.ensure_layout();
    auto previous = store.load_manifest();
    auto sources = store.scan();

    IndexManifest next;
    next.index_id = generate_uuid_hex();
    next.catalog_version = (previous ? previous->catalog_version : 0) + 1;
    next.trigger_job_id = reporter.current().job_id;

    const size_t total = sources.size();
    size_t processed = 0;
    for (const auto& scan : sources) {
        reporter.throw_if_cancelled();

        const SourceRecord& rec = scan.record;
        const ManifestEntry* indexed = previous ? previous->find(rec.alias) : nullptr;
        bool changed = !indexed || indexed->checksum != rec.checksum;
        int documents = static_cast<int>(scan.documents.size());

        ++processed;
        double percent = static_cast<double>(processed) / static_cast<double>(total) * 100.0;
        if (changed) {
            reporter.stage("ingesting:" + rec.alias, percent, documents);
        } else {
            reporter.stage("skipping:" + rec.alias, percent);
        }

        next.sources.push_back({rec.alias, rec.checksum, documents});
        next.document_count += documents;
    }

    reporter.throw_if_cancelled();
    next.built_at = timestamp_iso();
    store.save_manifest(next);
    LOG_INFO("Handlers", "Index " + next.index_id + " written: " +
             std::to_string(next.sources.size()) + " sources, " +
             std::to_string(next.document_count) + " documents");
}

// ============================================================================
// Admin
// ============================================================================

Response Handlers::handle_init(const Request& req, const HandlerContext& context) {
    SourceStore store(context.data_dir);

    InitResponse resp;
    resp.created_directories = store.ensure_layout();

    std::vector<std::string> seeded;
    for (const auto& seed : context.seeds) {
        if (store.seed(seed)) {
            seeded.push_back(seed.alias);
        }
    }
    for (auto& scan : store.scan()) {
        if (std::find(seeded.begin(), seeded.end(), scan.record.alias) != seeded.end()) {
            resp.seeded_sources.push_back(std::move(scan.record));
        }
    }

    auto manifest = store.load_manifest();
    resp.catalog_version = manifest ? manifest->catalog_version : 0;

    HealthResult probe = check_ollama(context.ollama.get());
    resp.dependency_checks.push_back({probe.component, probe.status, probe.message, probe.remediation});
    resp.trace_id = body_trace_id(req.body);

    LOG_INFO("Handlers", "Init created " + std::to_string(resp.created_directories.size()) +
             " directories, seeded " + std::to_string(resp.seeded_sources.size()) + " sources");
    return Response::ok(resp.to_json());
}

Response Handlers::handle_health(const Request& req, const HandlerContext& context) {
    SourceStore store(context.data_dir);

    HealthSummary summary;
    summary.results.push_back(check_disk(store));
    summary.results.push_back(check_index(store));
    summary.results.push_back(check_sources(store));
    summary.results.push_back(check_ollama(context.ollama.get()));
    summary.overall_status = aggregate_status(summary.results);
    summary.trace_id = body_trace_id(req.body);
    return Response::ok(summary.to_json());
}

std::string Handlers::aggregate_status(const std::vector<HealthResult>& results) {
    bool warn = false;
    for (const auto& result : results) {
        if (result.status == HealthStatus::FAIL) {
            return HealthStatus::FAIL;
        }
        if (result.status == HealthStatus::WARN) {
            warn = true;
        }
    }
    return warn ? HealthStatus::WARN : HealthStatus::PASS;
}

HealthResult Handlers::check_disk(const SourceStore& store) {
    HealthResult result;
    result.component = "disk_capacity";

    // data_dir may not exist before init; measure its closest existing ancestor
    fs::path probe = store.data_dir();
    std::error_code ec;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        probe = probe.parent_path();
    }

    fs::space_info info = fs::space(probe.empty() ? fs::path("/") : probe, ec);
    if (ec || info.capacity == 0) {
        result.status = HealthStatus::FAIL;
        result.message = "Unable to read disk usage for " + store.data_dir().string();
        result.remediation = "Verify mount points and ensure the ragcli data volume is accessible.";
        return result;
    }

    double ratio = static_cast<double>(info.available) / static_cast<double>(info.capacity);
    double percent_free = ratio * 100.0;
    result.metrics["percent_free"] = percent_free;
    result.metrics["available_bytes"] = static_cast<double>(info.available);
    result.metrics["total_bytes"] = static_cast<double>(info.capacity);

    char message[64];
    std::snprintf(message, sizeof(message), "%.0f%% free space remaining", percent_free);
    result.message = message;

    if (ratio <= DISK_FAIL_RATIO) {
        result.status = HealthStatus::FAIL;
        result.remediation = "Delete temporary files or expand the partition.";
    } else if (ratio <= DISK_WARN_RATIO) {
        result.status = HealthStatus::WARN;
        result.remediation = "Delete temporary files or expand the partition.";
    } else {
        result.status = HealthStatus::PASS;
    }
    return result;
}

HealthResult Handlers::check_index(const SourceStore& store) {
    HealthResult result;
    result.component = "index_freshness";

    auto manifest = store.load_manifest();
    if (!manifest) {
        result.status = HealthStatus::WARN;
        result.message = "No index has been built yet.";
        result.remediation = "Run ragctl reindex to build the knowledge index.";
        return result;
    }

    result.metrics["catalog_version"] = manifest->catalog_version;
    result.metrics["document_count"] = manifest->document_count;
    result.metrics["snapshot_count"] = static_cast<double>(manifest->sources.size());

    auto built = from_iso(manifest->built_at);
    auto age = built ? std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *built)
                     : std::chrono::seconds(0);
    if (age.count() < 0) {
        age = std::chrono::seconds(0);
    }
    long days = static_cast<long>(age.count() / 86400);
    result.metrics["age_seconds"] = static_cast<double>(age.count());

    if (days >= INDEX_WARN_AGE_DAYS) {
        result.status = HealthStatus::WARN;
        result.message = "Active index is " + std::to_string(days) + " days old; refresh recommended.";
        result.remediation = "Run ragctl reindex to refresh the knowledge index.";
    } else {
        result.status = HealthStatus::PASS;
        result.message = days > 0 ? "Index updated " + std::to_string(days) + " days ago."
                                  : "Index recently updated.";
    }
    return result;
}

HealthResult Handlers::check_sources(const SourceStore& store) {
    HealthResult result;
    result.component = "source_access";

    std::vector<std::string> pending;
    auto sources = store.scan();
    for (const auto& scan : sources) {
        if (scan.record.status != "active") {
            pending.push_back(scan.record.alias);
        }
    }
    result.metrics["active_sources"] = static_cast<double>(sources.size() - pending.size());
    result.metrics["pending_sources"] = static_cast<double>(pending.size());

    if (sources.empty()) {
        result.status = HealthStatus::FAIL;
        result.message = "No sources registered; ingestion must succeed before querying.";
        result.remediation = "Use ragctl init or add a directory under " + store.sources_dir().string() + ".";
    } else if (!pending.empty()) {
        std::string names;
        for (const auto& alias : pending) {
            names += (names.empty() ? "" : ", ") + alias;
        }
        result.status = HealthStatus::WARN;
        result.message = "Sources pending validation: " + names;
        result.remediation = "Run ragctl reindex to ingest pending sources.";
    } else {
        result.status = HealthStatus::PASS;
        result.message = "All sources accessible.";
    }
    return result;
}

HealthResult Handlers::check_ollama(OllamaClient* ollama) {
    HealthResult result;
    result.component = "ollama";

    if (!ollama) {
        result.status = HealthStatus::WARN;
        result.message = "No language model backend configured.";
        result.remediation = "Set network.ollama_url in the daemon configuration.";
        return result;
    }

    auto started = SteadyClock::now();
    auto models = ollama->list_models();
    result.metrics["latency_ms"] = elapsed_ms(started);

    if (!models.ok()) {
        result.status = HealthStatus::FAIL;
        result.message = models.error.message;
        result.remediation = models.error.kind == ErrorKind::NETWORK_BLOCKED
            ? "Point network.ollama_url at a loopback address or disable offline mode."
            : "Start Ollama (ollama serve) at " + ollama->base_url() + " and retry.";
        return result;
    }

    result.metrics["models"] = static_cast<double>(models.value.size());
    bool present = std::find(models.value.begin(), models.value.end(), ollama->model()) != models.value.end();
    if (present) {
        result.status = HealthStatus::PASS;
        result.message = "Model " + ollama->model() + " is available.";
    } else {
        result.status = HealthStatus::WARN;
        result.message = "Model " + ollama->model() + " is not pulled.";
        result.remediation = "Run ollama pull " + ollama->model() + ".";
    }
    return result;
}

} // namespace ragd
