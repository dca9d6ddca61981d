#include <protocol/wire_protocol.hpp>

#include <algorithm>

#include <nlohmann/json.hpp>

namespace ci {
    const char* to_string(OversizePolicy p) {
        switch (p) {
            case OversizePolicy::Close: return "close";
            case OversizePolicy::Drain: return "drain";
        }
        return "unknown";
    }

    std::optional<OversizePolicy> oversize_policy_from_str(const std::string& s) {
        if (s == "close") return OversizePolicy::Close;
        if (s == "drain") return OversizePolicy::Drain;
        return std::nullopt;
    }

    const char* to_string(FrameStatus s) {
        switch (s) {
            case FrameStatus::Frame: return "frame";
            case FrameStatus::Drained: return "drained";
            case FrameStatus::Closed: return "closed";
            case FrameStatus::Timeout: return "timeout";
            case FrameStatus::Error: return "error";
            case FrameStatus::Superseded: return "superseded";
            case FrameStatus::Corrupt: return "corrupt";
        }
        return "unknown";
    }

    uint32_t decode_be32(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) |
               static_cast<uint32_t>(p[3]);
    }

    void encode_be32(uint32_t v, uint8_t* p) {
        p[0] = static_cast<uint8_t>(v >> 24);
        p[1] = static_cast<uint8_t>(v >> 16);
        p[2] = static_cast<uint8_t>(v >> 8);
        p[3] = static_cast<uint8_t>(v);
    }

    std::vector<uint8_t> encode_message(const uint8_t* data, size_t n) {
        std::vector<uint8_t> out(kHeaderBytes + n);
        encode_be32(static_cast<uint32_t>(n), out.data());
        if (n > 0) std::copy(data, data + n, out.begin() + kHeaderBytes);
        return out;
    }

    std::vector<uint8_t> encode_message(const std::string& s) {
        return encode_message(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    std::optional<Handshake> parse_handshake(const uint8_t* data, size_t n) {
        // parse() validates UTF-8 in string values and throws on bad input
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(data, data + n);
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
        if (!j.is_object()) return std::nullopt;

        Handshake hs;
        auto it = j.find("camera_id");
        if (it != j.end() && it->is_string()) {
            hs.camera_id = it->get<std::string>();
        }
        return hs;
    }

    FrameReader::FrameReader(TcpSocket& sock,
                             ProtocolLimits limits,
                             std::chrono::milliseconds read_timeout,
                             int interrupt_fd)
        : sock_(sock),
          limits_(limits),
          timeout_(read_timeout),
          interrupt_fd_(interrupt_fd) {}

    FrameStatus FrameReader::from_read_(ReadStatus s) {
        switch (s) {
            case ReadStatus::Ok: return FrameStatus::Frame;
            case ReadStatus::Closed: return FrameStatus::Closed;
            case ReadStatus::Timeout: return FrameStatus::Timeout;
            case ReadStatus::Superseded: return FrameStatus::Superseded;
            case ReadStatus::Error: return FrameStatus::Error;
        }
        return FrameStatus::Error;
    }

    FrameReader::HandshakeResult FrameReader::read_handshake() {
        HandshakeResult res;

        uint8_t hdr[kHeaderBytes];
        size_t got = 0;
        const ReadStatus st = sock_.read_exact(hdr, sizeof(hdr), timeout_, interrupt_fd_, &got);
        if (st == ReadStatus::Timeout && got == 0) {
            // client is quiet: no handshake, the frame loop keeps waiting
            return res;
        }
        if (st != ReadStatus::Ok) {
            res.status = st;
            return res;
        }

        const uint32_t len = decode_be32(hdr);
        if (len == 0 || len >= limits_.max_handshake_bytes) {
            pending_header_ = len;
            return res;
        }

        std::vector<uint8_t> body(len);
        const ReadStatus bst = sock_.read_exact(body.data(), body.size(), timeout_);
        if (bst != ReadStatus::Ok) {
            res.status = bst;
            return res;
        }

        // an unparsable body is consumed and dropped, identity stays as is
        res.consumed = true;
        res.handshake = parse_handshake(body.data(), body.size());
        return res;
    }

    FrameStatus FrameReader::next(std::vector<uint8_t>& payload) {
        uint32_t len = 0;
        if (pending_header_) {
            len = *pending_header_;
            pending_header_.reset();
        } else {
            uint8_t hdr[kHeaderBytes];
            const ReadStatus st = sock_.read_exact(hdr, sizeof(hdr), timeout_, interrupt_fd_);
            if (st != ReadStatus::Ok) return from_read_(st);
            len = decode_be32(hdr);
        }
        last_length_ = len;

        if (len == 0 || len > limits_.max_frame_bytes) {
            if (limits_.oversize == OversizePolicy::Close) return FrameStatus::Corrupt;
            return drain_(len);
        }
        return read_payload_(len, payload);
    }

    FrameStatus FrameReader::read_payload_(uint32_t len, std::vector<uint8_t>& payload) {
        payload.resize(len);
        const ReadStatus st = sock_.read_exact(payload.data(), payload.size(), timeout_);
        if (st != ReadStatus::Ok) {
            payload.clear();
            return from_read_(st);
        }
        return FrameStatus::Frame;
    }

    FrameStatus FrameReader::drain_(uint32_t len) {
        std::vector<uint8_t> scratch(std::min<uint32_t>(len, 64u * 1024u));
        uint32_t left = len;
        while (left > 0) {
            const size_t chunk = std::min<size_t>(left, scratch.size());
            const ReadStatus st = sock_.read_exact(scratch.data(), chunk, timeout_);
            if (st != ReadStatus::Ok) return from_read_(st);
            left -= static_cast<uint32_t>(chunk);
        }
        return FrameStatus::Drained;
    }
}
