#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <protocol/control_command.hpp>

namespace ci {
    class MJPEGServer {
    public:
        // nullopt: no such stream
        using ControlHandler =
            std::function<std::optional<ControlSendResult>(const std::string& stream_key,
                                                           const ControlCommand& cmd)>;

        MJPEGServer(std::string host, int port);
        ~MJPEGServer();

        // Bind and serve in a bg thread. false if the port can't be bound.
        bool start();
        void stop();

        // actual port once started (port 0 picks a free one)
        int bound_port() const { return bound_port_; }

        // push latest jpeg payload as received from the camera
        void push_jpeg(const std::string& stream_key,
                       std::shared_ptr<const std::vector<uint8_t>> jpeg);

        // latest stats JSON for /stats
        void push_meta(const std::string& stream_key, std::string json);

        void set_control_handler(ControlHandler h);

        void register_stream(const std::string& stream_key);

        std::vector<std::string> list_streams() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        struct StreamState {
            mutable std::mutex mtx;
            std::condition_variable cv;

            std::shared_ptr<const std::vector<uint8_t>> last_jpeg;
            uint64_t seq = 0;

            mutable std::mutex meta_mtx;
            std::string last_meta;
        };

        std::shared_ptr<StreamState> get_or_create_(const std::string& stream_key) const;
        std::shared_ptr<StreamState> get_(const std::string& stream_key) const;
        void install_routes_();
        ControlHandler control_handler_() const;

        std::string host_;
        int port_;
        int bound_port_ = 0;

        std::thread server_thread_;
        std::atomic<bool> running_{false};

        mutable std::mutex streams_mtx_;
        mutable std::unordered_map<std::string, std::shared_ptr<StreamState>> streams_;

        mutable std::mutex control_mtx_;
        ControlHandler control_;
    };
}
