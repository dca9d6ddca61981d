#include <net/tcp_socket.hpp>

#include <common/errors.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ci {
    const char* to_string(ReadStatus s) {
        switch (s) {
            case ReadStatus::Ok: return "ok";
            case ReadStatus::Closed: return "closed";
            case ReadStatus::Timeout: return "timeout";
            case ReadStatus::Error: return "error";
            case ReadStatus::Superseded: return "superseded";
        }
        return "unknown";
    }

    static int poll_timeout_ms(std::chrono::milliseconds t) {
        if (t.count() < 0) return -1;
        if (t.count() > 0x7fffffff) return 0x7fffffff;
        return static_cast<int>(t.count());
    }

    static std::string sockaddr_to_string(const sockaddr_storage& ss) {
        char host[INET6_ADDRSTRLEN] = {0};
        int port = 0;
        if (ss.ss_family == AF_INET) {
            const auto* a = reinterpret_cast<const sockaddr_in*>(&ss);
            inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host));
            port = ntohs(a->sin_port);
        } else if (ss.ss_family == AF_INET6) {
            const auto* a = reinterpret_cast<const sockaddr_in6*>(&ss);
            inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host));
            port = ntohs(a->sin6_port);
        } else {
            return "?";
        }
        return std::string(host) + ":" + std::to_string(port);
    }

    // TcpSocket

    TcpSocket::~TcpSocket() { close(); }

    TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }

    TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
        if (this != &o) {
            close();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void TcpSocket::shutdown() {
        if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
    }

    void TcpSocket::close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ReadStatus TcpSocket::read_exact(uint8_t* dst, size_t n,
                                     std::chrono::milliseconds timeout,
                                     int interrupt_fd,
                                     size_t* got_out) {
        size_t got = 0;
        const ReadStatus st = read_exact_(dst, n, timeout, interrupt_fd, got);
        if (got_out) *got_out = got;
        return st;
    }

    ReadStatus TcpSocket::read_exact_(uint8_t* dst, size_t n,
                                      std::chrono::milliseconds timeout,
                                      int interrupt_fd,
                                      size_t& got) {
        if (fd_ < 0) return ReadStatus::Error;

        while (got < n) {
            pollfd fds[2];
            fds[0] = {fd_, POLLIN, 0};
            nfds_t nfds = 1;
            if (interrupt_fd >= 0 && got == 0) {
                fds[1] = {interrupt_fd, POLLIN, 0};
                nfds = 2;
            }

            const int pr = ::poll(fds, nfds, poll_timeout_ms(timeout));
            if (pr < 0) {
                if (errno == EINTR) continue;
                return ReadStatus::Error;
            }
            if (pr == 0) return ReadStatus::Timeout;

            // data already queued on our socket wins over a waiting connection
            if (nfds == 2 && fds[1].revents != 0 && fds[0].revents == 0) {
                return ReadStatus::Superseded;
            }
            if (fds[0].revents == 0) continue;

            const ssize_t r = ::recv(fd_, dst + got, n - got, 0);
            if (r == 0) return ReadStatus::Closed;
            if (r < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return ReadStatus::Error;
            }
            got += static_cast<size_t>(r);
        }
        return ReadStatus::Ok;
    }

    bool TcpSocket::write_all(const void* data, size_t n, std::string* err) {
        if (fd_ < 0) {
            if (err) *err = "socket not open";
            return false;
        }

        const auto* p = static_cast<const uint8_t*>(data);
        size_t sent = 0;
        while (sent < n) {
            const ssize_t w = ::send(fd_, p + sent, n - sent, MSG_NOSIGNAL);
            if (w < 0) {
                if (errno == EINTR) continue;
                if (err) *err = (errno == EAGAIN || errno == EWOULDBLOCK) ? "send timed out" : std::strerror(errno);
                return false;
            }
            sent += static_cast<size_t>(w);
        }
        return true;
    }

    bool TcpSocket::set_nodelay(bool on) {
        const int v = on ? 1 : 0;
        return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &v, sizeof(v)) == 0;
    }

    bool TcpSocket::set_buffer_sizes(int recv_bytes, int send_bytes) {
        bool ok = true;
        if (recv_bytes > 0) {
            ok = ::setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &recv_bytes, sizeof(recv_bytes)) == 0 && ok;
        }
        if (send_bytes > 0) {
            ok = ::setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &send_bytes, sizeof(send_bytes)) == 0 && ok;
        }
        return ok;
    }

    bool TcpSocket::set_send_timeout(std::chrono::milliseconds timeout) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        return ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    std::string TcpSocket::peer() const {
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        if (fd_ < 0 || ::getpeername(fd_, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return "?";
        return sockaddr_to_string(ss);
    }

    // TcpListener

    TcpListener::~TcpListener() { close(); }

    TcpListener::TcpListener(TcpListener&& o) noexcept : fd_(o.fd_), port_(o.port_) {
        o.fd_ = -1;
        o.port_ = 0;
    }

    TcpListener& TcpListener::operator=(TcpListener&& o) noexcept {
        if (this != &o) {
            close();
            fd_ = o.fd_;
            port_ = o.port_;
            o.fd_ = -1;
            o.port_ = 0;
        }
        return *this;
    }

    TcpListener TcpListener::bind(const std::string& host, int port, int backlog) {
        if (port < 0 || port > 65535) throw BindError(host, port, "port out of range");

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

        addrinfo* res = nullptr;
        const std::string service = std::to_string(port);
        const int gr = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
        if (gr != 0) throw BindError(host, port, ::gai_strerror(gr));

        std::string last_err = "no usable address";
        TcpListener out;
        for (addrinfo* ai = res; ai; ai = ai->ai_next) {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                last_err = std::strerror(errno);
                continue;
            }

            const int one = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

            if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 || ::listen(fd, backlog) != 0) {
                last_err = std::strerror(errno);
                ::close(fd);
                continue;
            }

            out.fd_ = fd;
            break;
        }
        ::freeaddrinfo(res);

        if (out.fd_ < 0) throw BindError(host, port, last_err);

        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        if (::getsockname(out.fd_, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
            if (ss.ss_family == AF_INET) {
                out.port_ = ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
            } else if (ss.ss_family == AF_INET6) {
                out.port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
            }
        }
        return out;
    }

    AcceptStatus TcpListener::accept(TcpSocket& out, std::chrono::milliseconds timeout) {
        if (fd_ < 0) return AcceptStatus::Error;

        pollfd pfd{fd_, POLLIN, 0};
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, poll_timeout_ms(timeout));
        } while (pr < 0 && errno == EINTR);

        if (pr < 0) return AcceptStatus::Error;
        if (pr == 0) return AcceptStatus::Timeout;

        const int cfd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            // the pending connection went away between poll and accept
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR) {
                return AcceptStatus::Timeout;
            }
            return AcceptStatus::Error;
        }
        out = TcpSocket(cfd);
        return AcceptStatus::Accepted;
    }

    void TcpListener::shutdown() {
        if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
    }

    void TcpListener::close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        port_ = 0;
    }
}
