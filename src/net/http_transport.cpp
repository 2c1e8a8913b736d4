/**
 * @file http_transport.cpp
 * @brief Process-wide default HTTP transport
 */

#include "ragd/net/http_transport.h"
#include <mutex>

namespace ragd {

namespace {

std::mutex& default_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<HttpTransport>& default_slot() {
    static std::shared_ptr<HttpTransport> transport;
    return transport;
}

}  // namespace

std::shared_ptr<HttpTransport> default_http_transport() {
    std::lock_guard<std::mutex> lock(default_mutex());
    auto& slot = default_slot();
    if (!slot) {
        slot = std::make_shared<CurlTransport>();
    }
    return slot;
}

std::shared_ptr<HttpTransport> set_default_http_transport(std::shared_ptr<HttpTransport> transport) {
    std::lock_guard<std::mutex> lock(default_mutex());
    auto previous = default_slot();
    default_slot() = std::move(transport);
    return previous;
}

} // namespace ragd
