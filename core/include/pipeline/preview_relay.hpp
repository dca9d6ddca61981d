#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <common/config.hpp>
#include <encode/mjpeg_server.hpp>
#include <ingest/camera_registry.hpp>

namespace ci {
    // Consumer side of the registry: drains each camera's latest frame on a
    // short cadence, republishes it on the gateway and refreshes stats JSON on
    // a slower one. Also routes gateway control requests back to the cameras.
    class PreviewRelay {
    public:
        PreviewRelay(CameraRegistry& registry, MJPEGServer& server, IngestConfig cfg);
        ~PreviewRelay() { stop(); }

        bool start();
        void stop();

        // One poll pass over every camera. Returns how many frames were relayed.
        int poll_once();
        void publish_stats_once();

        static std::string stats_json(const StreamStats& s,
                                      Clock::time_point now,
                                      std::chrono::milliseconds stale_after);

    private:
        void loop_();

        CameraRegistry& registry_;
        MJPEGServer& server_;
        IngestConfig cfg_;

        std::atomic<bool> running_{false};
        std::thread thr_;
    };
}
