#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <pipeline/types.hpp>

namespace ci {
    // Rolling 1s fps window and push-time latency for one endpoint.
    // Written by the ingest thread, read by the consumer through snapshot().
    class StatsTracker {
    public:
        explicit StatsTracker(std::string camera_id,
                              std::chrono::milliseconds window = std::chrono::seconds(1));

        // new client session: restart the fps window
        void begin_session(Clock::time_point now);
        void end_session();

        void on_frame(Clock::time_point now, Clock::time_point captured_at);

        // consumer-side latency, measured when the frame is actually displayed
        void note_displayed(Clock::time_point now, Clock::time_point captured_at);

        void set_camera_id(const std::string& id);
        std::string camera_id() const;

        StreamStats snapshot() const;

    private:
        static double latency_ms_(Clock::time_point now, Clock::time_point captured_at);

        mutable std::mutex mtx_;
        StreamStats stats_;

        std::chrono::milliseconds window_;
        uint64_t window_count_ = 0;
        Clock::time_point window_start_{};
    };
}
