#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ci {
    using Clock = std::chrono::steady_clock;
    using Payload = std::shared_ptr<const std::vector<uint8_t>>;

    // One complete payload as received from a camera client.
    // Fields are fixed at construction; copies share the payload bytes.
    class Frame {
    public:
        Frame() = default;
        Frame(Payload payload, Clock::time_point captured_at, int64_t frame_id, std::string camera_id)
            : payload_(std::move(payload)),
              captured_at_(captured_at),
              frame_id_(frame_id),
              camera_id_(std::move(camera_id)) {}

        const Payload& payload() const { return payload_; }
        Clock::time_point captured_at() const { return captured_at_; }
        int64_t frame_id() const { return frame_id_; }
        const std::string& camera_id() const { return camera_id_; }

        size_t size() const { return payload_ ? payload_->size() : 0; }
        bool empty() const { return size() == 0; }

    private:
        Payload payload_;
        Clock::time_point captured_at_{};
        int64_t frame_id_ = 0;
        std::string camera_id_;
    };

    struct StreamStats {
        std::string camera_id;
        double fps = 0.0;
        double latency_ms = 0.0;
        Clock::time_point last_updated{};

        uint64_t frames_total = 0;
        uint64_t sessions_total = 0;
        bool client_connected = false;

        // no push yet, or the last one is older than max_age
        bool is_stale(Clock::time_point now, std::chrono::milliseconds max_age) const {
            if (frames_total == 0) return true;
            return now - last_updated > max_age;
        }
    };
}
