#pragma once

#include <string>
#include <vector>

#include <protocol/wire_protocol.hpp>

namespace ci {
    struct CameraConfig {
        std::string id;
        std::string host = "0.0.0.0";
        int port = 5000;
    };

    struct IngestConfig {
        int accept_timeout_ms = 1000;
        int read_timeout_ms = 5000;

        ProtocolLimits limits;

        int recv_buffer_bytes = 512 * 1024;
        int send_buffer_bytes = 64 * 1024;
        bool tcp_nodelay = true;

        // consumer cadence
        int poll_interval_ms = 8;
        int stats_interval_ms = 500;
        int stale_after_ms = 2000;
    };

    struct ServerConfig {
        bool enabled = true;
        std::string url = "0.0.0.0";
        int port = 8080;
    };

    struct AppConfig {
        ServerConfig server;
        IngestConfig ingest;
        std::vector<CameraConfig> cameras;
    };

    // One camera "Camera 1" on 0.0.0.0:5000, everything else default.
    AppConfig default_config();

    AppConfig load_config_yaml(const std::string& path);
}
