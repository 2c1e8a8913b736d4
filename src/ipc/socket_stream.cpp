/**
 * @file socket_stream.cpp
 * @brief Unix domain socket stream implementation
 */

#include "ragd/ipc/socket_stream.h"
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <algorithm>

namespace ragd {

namespace {

// Upper bound for a single poll() so cancellation is observed promptly
constexpr int POLL_SLICE_MS = 50;

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

}  // namespace

SocketStream::SocketStream(int fd)
    : fd_(fd) {
}

SocketStream::~SocketStream() {
    close();
}

Result<std::unique_ptr<SocketStream>> SocketStream::connect_unix(const std::string& path,
                                                                  Duration timeout) {
    using R = Result<std::unique_ptr<SocketStream>>;

    struct sockaddr_un addr;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return R::failure(ErrorKind::INVALID_ARGUMENT, "invalid socket path: " + path);
    }
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    auto give_up_at = SteadyClock::now() + timeout;
    while (true) {
        int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd == -1) {
            return R::failure(ErrorKind::IO, errno_message("create socket"));
        }

        if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
            return R::success(std::make_unique<SocketStream>(fd));
        }

        int saved = errno;
        ::close(fd);
        // EAGAIN on AF_UNIX means the listen backlog is full
        if ((saved == EAGAIN || saved == EINTR) && SteadyClock::now() < give_up_at) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        errno = saved;
        return R::failure(ErrorKind::IO, errno_message("dial unix socket " + path));
    }
}

Result<size_t> SocketStream::read_some(char* buf, size_t len,
                                       SteadyTimePoint deadline,
                                       const CallContext& ctx) {
    using R = Result<size_t>;

    while (true) {
        int fd = fd_.load();
        if (fd == -1) {
            return R::failure(ErrorKind::IO, "socket closed");
        }

        Error stop = ctx.err();
        if (!stop.ok()) {
            return R::failure(stop);
        }

        auto now = SteadyClock::now();
        if (now >= deadline) {
            return R::failure(ErrorKind::TIMEOUT, "read timed out");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, POLL_SLICE_MS));

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready == 0) {
            continue;
        }
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            return R::failure(ErrorKind::IO, errno_message("poll"));
        }

        ssize_t n = recv(fd, buf, len, 0);
        if (n > 0) {
            return R::success(static_cast<size_t>(n));
        }
        if (n == 0) {
            return R::success(0);
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        if (errno == ECONNRESET) {
            return R::success(0);
        }
        return R::failure(ErrorKind::IO, errno_message("recv"));
    }
}

Error SocketStream::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        int fd = fd_.load();
        if (fd == -1) {
            return Error::make(ErrorKind::IO, "socket closed");
        }
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            poll(&pfd, 1, POLL_SLICE_MS);
            continue;
        }
        return Error::make(ErrorKind::IO, errno_message("send"));
    }
    return Error::none();
}

void SocketStream::shutdown() {
    int fd = fd_.load();
    if (fd != -1) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void SocketStream::close() {
    int fd = fd_.exchange(-1);
    if (fd != -1) {
        ::close(fd);
    }
}

bool SocketStream::is_open() const {
    return fd_.load() != -1;
}

std::string resolve_socket_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_path(override_path);
    }

    const char* env = std::getenv(SOCKET_ENV_VAR);
    if (env && *env) {
        return expand_path(env);
    }

    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && *runtime_dir) {
        return std::string(runtime_dir) + "/" + SOCKET_SUBDIR + "/" + SOCKET_FILENAME;
    }

    return "/tmp/" + std::string(SOCKET_SUBDIR) + "-" + std::to_string(getuid()) +
           "/" + SOCKET_FILENAME;
}

} // namespace ragd
