/**
 * @file offline_guard.cpp
 * @brief Offline network guard implementation
 */

#include "ragd/net/offline_guard.h"
#include "ragd/logger.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace ragd {

namespace {

struct GuardState {
    std::mutex mutex;
    int install_count = 0;
    std::shared_ptr<HttpTransport> original;
};

GuardState& guard_state() {
    static GuardState state;
    return state;
}

}  // namespace

std::string url_host(const std::string& url) {
    std::string rest = url;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
    }

    auto end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, end);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        host = authority.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

bool is_loopback_host(const std::string& host) {
    if (host.empty() || host == "localhost") {
        return true;
    }

    struct in_addr v4;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return (ntohl(v4.s_addr) >> 24) == 127;
    }

    struct in6_addr v6;
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        if (IN6_IS_ADDR_LOOPBACK(&v6)) {
            return true;
        }
        if (IN6_IS_ADDR_V4MAPPED(&v6)) {
            return v6.s6_addr[12] == 127;
        }
        return false;
    }

    // Names are never resolved; anything but localhost is remote
    return false;
}

// ============================================================================
// OfflineGuardTransport
// ============================================================================

OfflineGuardTransport::OfflineGuardTransport(std::shared_ptr<HttpTransport> base)
    : base_(std::move(base)) {
}

Result<HttpResponse> OfflineGuardTransport::send(const HttpRequest& request) {
    std::string host = url_host(request.url);
    if (!is_loopback_host(host)) {
        blocked_++;
        LOG_WARN("OfflineGuard", "Blocked outbound HTTP request: " + request.method + " " + host);
        return Result<HttpResponse>::failure(ErrorKind::NETWORK_BLOCKED,
            "external network access blocked: " + host);
    }
    if (!base_) {
        return Result<HttpResponse>::failure(ErrorKind::IO, "no underlying transport");
    }
    return base_->send(request);
}

// ============================================================================
// OfflineGuard
// ============================================================================

OfflineGuard::Handle OfflineGuard::install() {
    auto& state = guard_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (state.install_count == 0) {
        state.original = default_http_transport();
        set_default_http_transport(std::make_shared<OfflineGuardTransport>(state.original));
        LOG_INFO("OfflineGuard", "Outbound HTTP restricted to loopback hosts");
    }
    state.install_count++;
    return Handle(true);
}

bool OfflineGuard::installed() {
    return install_count() > 0;
}

int OfflineGuard::install_count() {
    auto& state = guard_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.install_count;
}

OfflineGuard::Handle::~Handle() {
    restore();
}

OfflineGuard::Handle::Handle(Handle&& other) noexcept
    : active_(other.active_) {
    other.active_ = false;
}

OfflineGuard::Handle& OfflineGuard::Handle::operator=(Handle&& other) noexcept {
    if (this != &other) {
        restore();
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void OfflineGuard::Handle::restore() {
    if (!active_) {
        return;
    }
    active_ = false;

    auto& state = guard_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.install_count == 0) {
        return;
    }
    state.install_count--;
    if (state.install_count == 0 && state.original) {
        set_default_http_transport(state.original);
        state.original.reset();
        LOG_INFO("OfflineGuard", "Outbound HTTP guard removed");
    }
}

} // namespace ragd
