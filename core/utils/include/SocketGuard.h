#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a non-blocking TCP socket used by reachability probes
 */

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>

namespace CodeDrop {

/**
 * @brief Closes the descriptor on destruction; move-only
 *
 * @code
 * auto sock = SocketGuard::openFor(*addr);
 * if (sock && sock.startConnect(*addr) == SocketGuard::Connect::InProgress) {
 *     sock.waitWritable(timeout);
 * }
 * @endcode
 */
class SocketGuard {
public:
    enum class Connect {
        Done,
        InProgress,
        Refused
    };

    enum class Wait {
        Ready,
        TimedOut,
        Failed
    };

    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() {
        reset();
    }

    // Non-blocking, close-on-exec socket matching the address family
    static SocketGuard openFor(const struct addrinfo& addr) {
        return SocketGuard(::socket(addr.ai_family, addr.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                                    addr.ai_protocol));
    }

    Connect startConnect(const struct addrinfo& addr) {
        if (::connect(fd_, addr.ai_addr, addr.ai_addrlen) == 0) {
            return Connect::Done;
        }
        return errno == EINPROGRESS ? Connect::InProgress : Connect::Refused;
    }

    Wait waitWritable(std::chrono::milliseconds timeout) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0) return Wait::TimedOut;
        if (ready < 0) return Wait::Failed;
        return Wait::Ready;
    }

    // SO_ERROR after a non-blocking connect; 0 means connected
    int pendingError() const {
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            return errno;
        }
        return soError;
    }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

} // namespace CodeDrop
