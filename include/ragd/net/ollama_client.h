/**
 * @file ollama_client.h
 * @brief HTTP adapter for a local Ollama instance
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/net/http_transport.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ragd {

struct GenerateOptions {
    std::optional<double> temperature;
    bool json_format = false;  // Ask the model for a JSON document
};

struct GenerateResult {
    std::string text;
    std::string model;
    int latency_ms = 0;
};

/**
 * @brief Talks to Ollama's REST API through an injected transport
 *
 * The transport comes from the caller so that the offline guard and test
 * fakes apply without any global lookup inside the adapter.
 */
class OllamaClient {
public:
    OllamaClient(std::shared_ptr<HttpTransport> transport,
                 std::string base_url = DEFAULT_OLLAMA_URL,
                 std::string model = DEFAULT_OLLAMA_MODEL,
                 Duration timeout = Duration(DEFAULT_HTTP_TIMEOUT_MS));

    /**
     * @brief Names of the locally available models (GET /api/tags)
     */
    Result<std::vector<std::string>> list_models();

    /**
     * @brief Non-streaming completion (POST /api/generate)
     */
    Result<GenerateResult> generate(const std::string& prompt, const GenerateOptions& options = {});

    const std::string& base_url() const { return base_url_; }
    const std::string& model() const { return model_; }

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string base_url_;
    std::string model_;
    Duration timeout_;

    Result<json> exchange(const HttpRequest& request);
};

} // namespace ragd
