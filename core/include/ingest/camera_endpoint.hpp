#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <common/config.hpp>
#include <net/tcp_socket.hpp>
#include <pipeline/latest_frame_buffer.hpp>
#include <pipeline/stats_tracker.hpp>
#include <pipeline/types.hpp>
#include <protocol/control_command.hpp>

namespace ci {
    enum class EndpointState {
        Idle,
        Listening,
        Stopped,
    };

    const char* to_string(EndpointState s);

    // One camera: a listening socket, at most one client session at a time,
    // the latest-frame slot and the stats of that camera.
    class CameraEndpoint {
    public:
        CameraEndpoint(std::string name, std::string host, int port, IngestConfig cfg = {});
        ~CameraEndpoint();

        CameraEndpoint(const CameraEndpoint&) = delete;
        CameraEndpoint& operator=(const CameraEndpoint&) = delete;

        // Bind and start the accept thread. No-op while listening.
        // Throws BindError, in which case the state does not change.
        void start();

        // Stop accepting, kick the client off and join the accept thread.
        void stop();

        EndpointState state() const { return state_.load(); }

        const std::string& name() const { return name_; }
        const std::string& host() const { return host_; }
        int port() const { return port_; }

        // actual port while listening (useful with port 0), 0 otherwise
        int bound_port() const { return bound_port_.load(); }

        // identity announced by the client handshake, the endpoint name until then
        std::string camera_id() const { return stats_.camera_id(); }

        std::optional<Frame> poll_frame() { return buffer_.pop(); }
        std::optional<Frame> peek_frame() const { return buffer_.peek(); }
        StreamStats stats() const { return stats_.snapshot(); }
        uint64_t dropped_frames() const { return buffer_.dropped(); }

        void note_displayed(const Frame& f);

        // Fire-and-forget. Never throws, never affects the ingest session.
        ControlSendResult send_control(const ControlCommand& cmd);

        bool client_attached() const;

    private:
        void accept_loop_();
        void serve_client_(const std::shared_ptr<TcpSocket>& client);
        bool attach_client_(const std::shared_ptr<TcpSocket>& client);
        void detach_client_();

        std::string tag_() const { return "[Endpoint:" + name_ + "]"; }

        std::string name_;
        std::string host_;
        int port_;
        IngestConfig cfg_;

        std::mutex lifecycle_mtx_;
        std::atomic<EndpointState> state_{EndpointState::Idle};
        std::atomic<bool> running_{false};
        std::atomic<int> bound_port_{0};

        TcpListener listener_;
        std::thread accept_thr_;

        mutable std::mutex client_mtx_;
        std::shared_ptr<TcpSocket> client_;
        std::mutex send_mtx_;

        LatestFrameBuffer buffer_;
        StatsTracker stats_;

        int64_t next_frame_id_ = 0; // accept thread only
    };
}
