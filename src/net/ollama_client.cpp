/**
 * @file ollama_client.cpp
 * @brief Ollama HTTP adapter implementation
 */

#include "ragd/net/ollama_client.h"
#include "ragd/logger.h"

namespace ragd {

OllamaClient::OllamaClient(std::shared_ptr<HttpTransport> transport,
                           std::string base_url,
                           std::string model,
                           Duration timeout)
    : transport_(std::move(transport))
    , base_url_(std::move(base_url))
    , model_(std::move(model))
    , timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

Result<json> OllamaClient::exchange(const HttpRequest& request) {
    if (!transport_) {
        return Result<json>::failure(ErrorKind::IO, "no HTTP transport configured");
    }

    LOG_DEBUG("OllamaClient", request.method + " " + request.url);
    auto response = transport_->send(request);
    if (!response.ok()) {
        return Result<json>::failure(response.error);
    }

    int status = response.value.status_code;
    json body;
    try {
        body = json::parse(response.value.body);
    } catch (const json::exception& e) {
        if (status < 200 || status >= 300) {
            return Result<json>::failure(ErrorKind::STATUS,
                "ollama returned status " + std::to_string(status), status);
        }
        return Result<json>::failure(ErrorKind::DECODE,
            "failed to parse ollama response: " + std::string(e.what()));
    }

    if (status < 200 || status >= 300) {
        std::string message = "ollama returned status " + std::to_string(status);
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            message += ": " + body["error"].get<std::string>();
        }
        return Result<json>::failure(ErrorKind::STATUS, message, status);
    }
    return Result<json>::success(std::move(body));
}

Result<std::vector<std::string>> OllamaClient::list_models() {
    HttpRequest request;
    request.method = "GET";
    request.url = base_url_ + "/api/tags";
    request.timeout = timeout_;

    auto body = exchange(request);
    if (!body.ok()) {
        return Result<std::vector<std::string>>::failure(body.error);
    }

    std::vector<std::string> models;
    if (body.value.contains("models") && body.value["models"].is_array()) {
        for (const auto& entry : body.value["models"]) {
            if (entry.is_object() && entry.contains("name") && entry["name"].is_string()) {
                models.push_back(entry["name"].get<std::string>());
            }
        }
    }
    return Result<std::vector<std::string>>::success(std::move(models));
}

Result<GenerateResult> OllamaClient::generate(const std::string& prompt, const GenerateOptions& options) {
    HttpRequest request;
    request.method = "POST";
    request.url = base_url_ + "/api/generate";
    request.headers = {"Content-Type: application/json"};
    json payload = {{"model", model_}, {"prompt", prompt}, {"stream", false}};
    if (options.temperature) {
        payload["options"] = {{"temperature", *options.temperature}};
    }
    if (options.json_format) {
        payload["format"] = "json";
    }
    request.body = payload.dump();
    request.timeout = timeout_;

    auto started = SteadyClock::now();
    auto body = exchange(request);
    if (!body.ok()) {
        return Result<GenerateResult>::failure(body.error);
    }

    if (!body.value.contains("response") || !body.value["response"].is_string()) {
        LOG_ERROR("OllamaClient", "Response: " + body.value.dump().substr(0, 200));
        return Result<GenerateResult>::failure(ErrorKind::DECODE, "invalid response format from ollama");
    }

    GenerateResult result;
    result.text = body.value["response"].get<std::string>();
    result.model = body.value.value("model", model_);
    result.latency_ms = static_cast<int>(std::chrono::duration_cast<Duration>(
        SteadyClock::now() - started).count());
    return Result<GenerateResult>::success(std::move(result));
}

} // namespace ragd
