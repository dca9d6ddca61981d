#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ci {
    enum class ReadStatus {
        Ok,
        Closed,     // orderly shutdown by the peer (or by us via shutdown())
        Timeout,
        Error,
        Superseded, // interrupt fd became readable before any byte arrived
    };

    const char* to_string(ReadStatus s);

    // Owning wrapper around a connected stream socket. Move-only.
    class TcpSocket {
    public:
        TcpSocket() = default;
        explicit TcpSocket(int fd) : fd_(fd) {}
        ~TcpSocket();

        TcpSocket(const TcpSocket&) = delete;
        TcpSocket& operator=(const TcpSocket&) = delete;
        TcpSocket(TcpSocket&& o) noexcept;
        TcpSocket& operator=(TcpSocket&& o) noexcept;

        int fd() const { return fd_; }
        bool valid() const { return fd_ >= 0; }

        // Wakes up any thread blocked on this socket. The descriptor stays open.
        void shutdown();
        void close();

        // Reads exactly n bytes. The timeout bounds each wait for more data.
        // If interrupt_fd >= 0 and becomes readable before the first byte,
        // returns Superseded without consuming anything.
        // got (optional) receives the number of bytes actually stored in dst.
        ReadStatus read_exact(uint8_t* dst, size_t n,
                              std::chrono::milliseconds timeout,
                              int interrupt_fd = -1,
                              size_t* got = nullptr);

        // Loops until every byte is written. On failure err holds the reason.
        bool write_all(const void* data, size_t n, std::string* err = nullptr);

        bool set_nodelay(bool on);
        bool set_buffer_sizes(int recv_bytes, int send_bytes);
        bool set_send_timeout(std::chrono::milliseconds timeout);

        std::string peer() const;

    private:
        ReadStatus read_exact_(uint8_t* dst, size_t n,
                               std::chrono::milliseconds timeout,
                               int interrupt_fd,
                               size_t& got);

        int fd_ = -1;
    };

    enum class AcceptStatus {
        Accepted,
        Timeout,
        Error,
    };

    class TcpListener {
    public:
        TcpListener() = default;
        ~TcpListener();

        TcpListener(const TcpListener&) = delete;
        TcpListener& operator=(const TcpListener&) = delete;
        TcpListener(TcpListener&& o) noexcept;
        TcpListener& operator=(TcpListener&& o) noexcept;

        // SO_REUSEADDR + bind + listen. Throws BindError.
        static TcpListener bind(const std::string& host, int port, int backlog = 1);

        // Waits up to timeout for a pending connection.
        AcceptStatus accept(TcpSocket& out, std::chrono::milliseconds timeout);

        int fd() const { return fd_; }
        bool valid() const { return fd_ >= 0; }
        int port() const { return port_; }

        void shutdown();
        void close();

    private:
        int fd_ = -1;
        int port_ = 0;
    };
}
