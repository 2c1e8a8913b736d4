/**
 * @file handlers.h
 * @brief Backend request handlers for the query, sources, reindex and admin paths
 */

#pragma once

#include "ragd/core/source_store.h"
#include "ragd/ipc/models.h"
#include "ragd/ipc/protocol.h"
#include "ragd/ipc/server.h"
#include "ragd/net/ollama_client.h"
#include <memory>
#include <string>
#include <vector>

namespace ragd {

/**
 * @brief Answers a normalized question
 */
class QueryService {
public:
    virtual ~QueryService() = default;

    virtual Result<QueryResponse> answer(const QueryRequest& request) = 0;
};

/**
 * @brief Retrieval over the indexed sources plus Ollama generation
 *
 * Without an index the service answers with no_answer set and a reindex
 * hint instead of calling the model.
 */
class OllamaQueryService : public QueryService {
public:
    OllamaQueryService(std::shared_ptr<OllamaClient> ollama, std::string data_dir);

    Result<QueryResponse> answer(const QueryRequest& request) override;

private:
    std::shared_ptr<OllamaClient> ollama_;
    SourceStore store_;

    static std::string render_prompt(const std::string& question, const std::vector<Snippet>& contexts);
};

/**
 * @brief Collaborators shared by all handlers
 */
struct HandlerContext {
    std::string data_dir = DEFAULT_DATA_DIR;
    std::shared_ptr<QueryService> query;
    std::shared_ptr<OllamaClient> ollama;  // Dependency probe; null reports a warning
    std::vector<SeedSource> seeds = {
        {"man-pages", "/usr/share/man"},
        {"info-pages", "/usr/share/info"}
    };
};

/**
 * @brief IPC request handlers
 */
class Handlers {
public:
    /**
     * @brief Register all handlers with IPC server
     */
    static void register_all(IPCServer& server, HandlerContext context);

    /**
     * @brief Worst status among checks: fail, then warn, then pass
     */
    static std::string aggregate_status(const std::vector<HealthResult>& results);

private:
    static Response handle_query(const Request& req, QueryService* service);
    static Response handle_sources(const Request& req, const SourceStore& store);
    static JobLaunch handle_reindex(const Request& req, std::shared_ptr<const SourceStore> store);
    static Response handle_init(const Request& req, const HandlerContext& context);
    static Response handle_health(const Request& req, const HandlerContext& context);

    static void run_reindex(JobReporter& reporter, const SourceStore& store);

    static HealthResult check_disk(const SourceStore& store);
    static HealthResult check_index(const SourceStore& store);
    static HealthResult check_sources(const SourceStore& store);
    static HealthResult check_ollama(OllamaClient* ollama);
};

} // namespace ragd
