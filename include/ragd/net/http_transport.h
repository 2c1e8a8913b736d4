/**
 * @file http_transport.h
 * @brief Outbound HTTP abstraction shared by every HTTP-speaking adapter
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include <memory>
#include <string>
#include <vector>

namespace ragd {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::string body;
    Duration timeout{DEFAULT_HTTP_TIMEOUT_MS};
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
};

/**
 * @brief Performs one HTTP exchange
 *
 * Transport failures are returned as errors; any HTTP status, including
 * 4xx and 5xx, is a successful exchange and is left to the caller.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl easy-interface transport
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, std::string* data);
};

/**
 * @brief Process-wide default transport (a CurlTransport unless replaced)
 *
 * Adapters must receive their transport through their constructor; only
 * process wiring such as the daemon reads the default.
 */
std::shared_ptr<HttpTransport> default_http_transport();

/**
 * @brief Replace the default transport
 * @return The previous default
 */
std::shared_ptr<HttpTransport> set_default_http_transport(std::shared_ptr<HttpTransport> transport);

} // namespace ragd
