/**
 * @file offline_guard.h
 * @brief Process-wide guard confining outbound HTTP to loopback hosts
 */

#pragma once

#include "ragd/net/http_transport.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace ragd {

/**
 * @brief Host part of a URL, lowercased, without brackets, port or userinfo
 */
std::string url_host(const std::string& url);

/**
 * @brief Whether a host is local
 *
 * "localhost" and loopback IP literals (127.0.0.0/8, ::1, ::ffff:127.x)
 * are local. Other names are not resolved and count as remote. An empty
 * host is left to the underlying transport.
 */
bool is_loopback_host(const std::string& host);

/**
 * @brief Transport wrapper that refuses non-loopback destinations
 *
 * Blocked requests return NETWORK_BLOCKED without touching the wrapped
 * transport.
 */
class OfflineGuardTransport : public HttpTransport {
public:
    explicit OfflineGuardTransport(std::shared_ptr<HttpTransport> base);

    Result<HttpResponse> send(const HttpRequest& request) override;

    uint64_t blocked_count() const { return blocked_.load(); }
    const std::shared_ptr<HttpTransport>& base() const { return base_; }

private:
    std::shared_ptr<HttpTransport> base_;
    std::atomic<uint64_t> blocked_{0};
};

/**
 * @brief Installs OfflineGuardTransport in front of the default transport
 *
 * Installs nest: the guard is placed by the first install and the original
 * transport comes back when the last handle is restored.
 */
class OfflineGuard {
public:
    /**
     * @brief Restores the previous transport when released or destroyed
     *
     * restore() may be called any number of times; only the first call
     * counts.
     */
    class Handle {
    public:
        Handle() = default;
        ~Handle();

        Handle(Handle&& other) noexcept;
        Handle& operator=(Handle&& other) noexcept;
        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        void restore();
        bool active() const { return active_; }

    private:
        friend class OfflineGuard;
        explicit Handle(bool active) : active_(active) {}

        bool active_ = false;
    };

    static Handle install();

    static bool installed();
    static int install_count();
};

} // namespace ragd
