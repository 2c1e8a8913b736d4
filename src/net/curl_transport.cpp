/**
 * @file curl_transport.cpp
 * @brief libcurl implementation of HttpTransport
 */

#include "ragd/net/http_transport.h"
#include "ragd/logger.h"

#include <curl/curl.h>
#include <mutex>

namespace ragd {

CurlTransport::CurlTransport() {
    // curl_global_init is not thread-safe; run it once per process
    static std::once_flag curl_initialized;
    std::call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("HttpTransport", "Failed to initialize CURL");
        return Result<HttpResponse>::failure(ErrorKind::IO, "failed to initialize curl");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    // Hostless schemes such as file:// would slip past the offline guard
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    if (header_list) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string message = request.method + " " + request.url + ": " + curl_easy_strerror(res);
        LOG_DEBUG("HttpTransport", "CURL error: " + message);
        ErrorKind kind = res == CURLE_OPERATION_TIMEDOUT ? ErrorKind::TIMEOUT : ErrorKind::IO;
        return Result<HttpResponse>::failure(kind, message);
    }

    response.status_code = static_cast<int>(status);
    return Result<HttpResponse>::success(std::move(response));
}

} // namespace ragd
