#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <ingest/camera_endpoint.hpp>

namespace ci {
    // Owns every camera endpoint, keyed by name. The registry lock only
    // guards the map; each endpoint synchronizes its own state.
    class CameraRegistry {
    public:
        explicit CameraRegistry(IngestConfig cfg = {});
        ~CameraRegistry();

        CameraRegistry(const CameraRegistry&) = delete;
        CameraRegistry& operator=(const CameraRegistry&) = delete;

        // Throws DuplicateNameError. Names stay taken for the registry's lifetime.
        void add(const std::string& name, const std::string& host, int port);

        // Throws UnknownCameraError or BindError.
        void start(const std::string& name);

        // Unknown or already stopped: no-op.
        void stop(const std::string& name);
        void stop_all();

        std::optional<Frame> poll_frame(const std::string& name);
        std::optional<Frame> peek_frame(const std::string& name) const;
        std::optional<StreamStats> get_stats(const std::string& name) const;
        void note_displayed(const std::string& name, const Frame& f);

        // Unknown camera reports NoClient.
        ControlSendResult send_control(const std::string& name, const ControlCommand& cmd);

        bool contains(const std::string& name) const;
        std::optional<EndpointState> state(const std::string& name) const;
        int bound_port(const std::string& name) const;
        std::vector<std::string> names() const;

    private:
        std::shared_ptr<CameraEndpoint> get_(const std::string& name) const;

        IngestConfig cfg_;

        mutable std::mutex mtx_;
        std::map<std::string, std::shared_ptr<CameraEndpoint>> endpoints_;
    };
}
