#include "tcp_checker.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace {

// Closes the descriptor when the probe leaves scope.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

std::string connect_one(const addrinfo* addr, std::chrono::steady_clock::time_point deadline, int cancel_fd) {
    SocketGuard sock(::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol));
    if (sock.get() < 0) {
        return std::string("socket: ") + std::strerror(errno);
    }

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::string("fcntl: ") + std::strerror(errno);
    }

    if (::connect(sock.get(), addr->ai_addr, addr->ai_addrlen) == 0) {
        return "";
    }
    if (errno != EINPROGRESS) {
        return std::string("connect: ") + std::strerror(errno);
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return "connect: timed out";
    }

    pollfd pfds[2] = {};
    pfds[0].fd = sock.get();
    pfds[0].events = POLLOUT;
    pfds[1].fd = cancel_fd;
    pfds[1].events = POLLIN;
    nfds_t count = cancel_fd >= 0 ? 2 : 1;

    int rc;
    do {
        rc = ::poll(pfds, count, static_cast<int>(remaining.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        return "connect: timed out";
    }
    if (rc < 0) {
        return std::string("poll: ") + std::strerror(errno);
    }
    if (count == 2 && (pfds[1].revents & POLLIN)) {
        return "connect: cancelled";
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        return std::string("getsockopt: ") + std::strerror(errno);
    }
    if (so_error != 0) {
        return std::string("connect: ") + std::strerror(so_error);
    }

    return "";
}

} // namespace

std::string tcp_connect_probe(const std::string& host, int port, std::chrono::milliseconds timeout,
                              int cancel_fd) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw);
    if (rc != 0) {
        return std::string("getaddrinfo: ") + gai_strerror(rc);
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(raw);

    std::string last_error = "no addresses for " + host;
    for (const addrinfo* addr = addresses.get(); addr != nullptr; addr = addr->ai_next) {
        last_error = connect_one(addr, deadline, cancel_fd);
        if (last_error.empty()) {
            return "";
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    return last_error;
}

TcpChecker::TcpChecker(bool redis_ping)
    : redis_ping_(redis_ping), wake_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (wake_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

TcpChecker::~TcpChecker() {
    ::close(wake_fd_);
}

void TcpChecker::cancel() {
    cancelled_ = true;
    // Stays readable until resume(), so every later poll() wakes too
    if (eventfd_write(wake_fd_, 1) < 0) {
        spdlog::warn("Failed to wake TCP probe: {}", std::strerror(errno));
    }
}

void TcpChecker::resume() {
    eventfd_t drained = 0;
    if (eventfd_read(wake_fd_, &drained) < 0 && errno != EAGAIN) {
        spdlog::warn("Failed to reset TCP probe wake-up: {}", std::strerror(errno));
    }
    cancelled_ = false;
}

CheckOutcome TcpChecker::check(const EndpointView& endpoint) {
    if (cancelled_) {
        return CheckOutcome::aborted();
    }

    try {
        return redis_ping_ ? check_redis(endpoint) : check_connect(endpoint);
    } catch (const std::exception& e) {
        spdlog::debug("TCP health check for {} threw: {}", endpoint.definition.name, e.what());
        return CheckOutcome::unhealthy(e.what());
    }
}

CheckOutcome TcpChecker::check_redis(const EndpointView& endpoint) {
    const auto& def = endpoint.definition;
    auto start_time = std::chrono::steady_clock::now();

    try {
        sw::redis::ConnectionOptions connection_opts;
        connection_opts.host = def.host;
        connection_opts.port = def.port;
        connection_opts.connect_timeout = def.timeout;
        connection_opts.socket_timeout = def.timeout;

        // One connection, created for this probe only
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = 1;

        sw::redis::Redis redis(connection_opts, pool_opts);
        auto pong = redis.ping();

        if (pong != "PONG") {
            return CheckOutcome::unhealthy("Unexpected PING reply: " + pong, since(start_time));
        }

        CheckOutcome outcome;
        outcome.status = ServiceStatus::Healthy;
        outcome.response_time = since(start_time);
        spdlog::debug("Redis PING to {} answered in {} ms", def.name, outcome.response_time.count());
        return outcome;

    } catch (const sw::redis::Error& e) {
        if (cancelled_) {
            return CheckOutcome::aborted(since(start_time));
        }
        spdlog::debug("Redis PING to {} failed: {}", def.name, e.what());
        return CheckOutcome::unhealthy(e.what(), since(start_time));
    }
}

CheckOutcome TcpChecker::check_connect(const EndpointView& endpoint) {
    const auto& def = endpoint.definition;
    auto start_time = std::chrono::steady_clock::now();

    auto error = tcp_connect_probe(def.host, def.port, def.timeout, wake_fd_);
    if (!error.empty()) {
        if (cancelled_) {
            return CheckOutcome::aborted(since(start_time));
        }
        spdlog::debug("TCP connect to {} failed: {}", def.name, error);
        return CheckOutcome::unhealthy(error, since(start_time));
    }

    CheckOutcome outcome;
    outcome.status = ServiceStatus::Healthy;
    outcome.response_time = since(start_time);
    return outcome;
}
