#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <net/tcp_socket.hpp>

namespace ci {
    constexpr uint32_t kMaxFrameBytes = 5u * 1024u * 1024u;
    constexpr uint32_t kMaxHandshakeBytes = 1024u;
    constexpr size_t kHeaderBytes = 4;

    // What to do with a frame header whose length is 0 or above the limit.
    enum class OversizePolicy {
        Close, // end the session as corrupt
        Drain, // discard exactly L bytes, then resume
    };

    const char* to_string(OversizePolicy p);
    std::optional<OversizePolicy> oversize_policy_from_str(const std::string& s);

    struct ProtocolLimits {
        uint32_t max_frame_bytes = kMaxFrameBytes;
        uint32_t max_handshake_bytes = kMaxHandshakeBytes; // exclusive
        OversizePolicy oversize = OversizePolicy::Close;
    };

    uint32_t decode_be32(const uint8_t* p);
    void encode_be32(uint32_t v, uint8_t* p);

    // [4-byte big-endian length][payload]
    std::vector<uint8_t> encode_message(const uint8_t* data, size_t n);
    std::vector<uint8_t> encode_message(const std::string& s);

    struct Handshake {
        std::optional<std::string> camera_id;
    };

    // A handshake body is a UTF-8 JSON object. Returns nullopt for anything
    // else (bad UTF-8, bad JSON, not an object). A missing or non-string
    // camera_id still yields a Handshake, with camera_id unset.
    std::optional<Handshake> parse_handshake(const uint8_t* data, size_t n);

    enum class FrameStatus {
        Frame,
        Drained,    // an out-of-range frame was discarded, keep reading
        Closed,
        Timeout,
        Error,
        Superseded,
        Corrupt,    // out-of-range length under OversizePolicy::Close
    };

    const char* to_string(FrameStatus s);

    // Reads one client session: the optional handshake, then frames.
    // Not thread-safe; owned by the endpoint thread for the session's lifetime.
    class FrameReader {
    public:
        FrameReader(TcpSocket& sock,
                    ProtocolLimits limits,
                    std::chrono::milliseconds read_timeout,
                    int interrupt_fd = -1);

        struct HandshakeResult {
            ReadStatus status = ReadStatus::Ok;   // Ok unless the session must end
            std::optional<Handshake> handshake;   // set only when the body parsed
            bool consumed = false;                // a handshake-sized message was read
        };

        // Must be called once, before the first next(). A first message with
        // a length in (0, max_handshake_bytes) is always consumed here; if it
        // does not parse, handshake is unset. Any other length is kept and
        // framed by next() as the first frame header.
        HandshakeResult read_handshake();

        // Next frame. payload is only valid when the result is Frame.
        FrameStatus next(std::vector<uint8_t>& payload);

        uint32_t last_length() const { return last_length_; }

    private:
        FrameStatus read_payload_(uint32_t len, std::vector<uint8_t>& payload);
        FrameStatus drain_(uint32_t len);
        static FrameStatus from_read_(ReadStatus s);

        TcpSocket& sock_;
        ProtocolLimits limits_;
        std::chrono::milliseconds timeout_;
        int interrupt_fd_;

        std::optional<uint32_t> pending_header_;
        uint32_t last_length_ = 0;
    };
}
