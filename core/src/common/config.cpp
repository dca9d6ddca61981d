#include <common/config.hpp>

#include <stdexcept>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

namespace ci {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static void require_port(int port, const std::string& what) {
        if (port < 0 || port > 65535) {
            throw std::runtime_error("[Config] " + what + " port out of range: " + std::to_string(port));
        }
    }

    static void require_positive(int v, const char* key) {
        if (v <= 0) {
            throw std::runtime_error(std::string("[Config] ingest.") + key + " must be > 0");
        }
    }

    static IngestConfig parse_ingest_config(const YAML::Node& n) {
        IngestConfig c;
        if (!n) return c;

        c.accept_timeout_ms = get_int(n, "accept_timeout_ms", c.accept_timeout_ms);
        c.read_timeout_ms = get_int(n, "read_timeout_ms", c.read_timeout_ms);
        c.recv_buffer_bytes = get_int(n, "recv_buffer_bytes", c.recv_buffer_bytes);
        c.send_buffer_bytes = get_int(n, "send_buffer_bytes", c.send_buffer_bytes);
        c.tcp_nodelay = get_bool(n, "tcp_nodelay", c.tcp_nodelay);
        c.poll_interval_ms = get_int(n, "poll_interval_ms", c.poll_interval_ms);
        c.stats_interval_ms = get_int(n, "stats_interval_ms", c.stats_interval_ms);
        c.stale_after_ms = get_int(n, "stale_after_ms", c.stale_after_ms);

        const int max_frame = get_int(n, "max_frame_bytes", static_cast<int>(c.limits.max_frame_bytes));
        const int max_hs = get_int(n, "max_handshake_bytes", static_cast<int>(c.limits.max_handshake_bytes));

        require_positive(c.accept_timeout_ms, "accept_timeout_ms");
        require_positive(c.read_timeout_ms, "read_timeout_ms");
        require_positive(c.poll_interval_ms, "poll_interval_ms");
        require_positive(c.stats_interval_ms, "stats_interval_ms");
        require_positive(c.stale_after_ms, "stale_after_ms");
        require_positive(max_frame, "max_frame_bytes");
        require_positive(max_hs, "max_handshake_bytes");
        if (max_hs > max_frame) {
            throw std::runtime_error("[Config] max_handshake_bytes must not exceed max_frame_bytes");
        }

        c.limits.max_frame_bytes = static_cast<uint32_t>(max_frame);
        c.limits.max_handshake_bytes = static_cast<uint32_t>(max_hs);

        const std::string policy = get_str(n, "oversize_policy", to_string(c.limits.oversize));
        auto p = oversize_policy_from_str(policy);
        if (!p) {
            throw std::runtime_error("[Config] unknown oversize_policy: " + policy + " (close|drain)");
        }
        c.limits.oversize = *p;
        return c;
    }

    AppConfig default_config() {
        AppConfig cfg;
        CameraConfig cam;
        cam.id = "Camera 1";
        cfg.cameras.push_back(cam);
        return cfg;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        const YAML::Node srv = root["server"];
        cfg.server.enabled = get_bool(srv, "enabled", true);
        cfg.server.url = get_str(srv, "host", "0.0.0.0");
        cfg.server.port = get_int(srv, "port", 8080);
        require_port(cfg.server.port, "server");

        cfg.ingest = parse_ingest_config(root["ingest"]);

        auto arr = root["cameras"];
        if (!arr) {
            cfg.cameras = default_config().cameras;
            return cfg;
        }
        if (!arr.IsSequence() || arr.size() == 0) {
            throw std::runtime_error ("[Config] cameras must be a non-empty list!");
        }

        std::unordered_set<std::string> seen;
        int idx = 0;
        for (const auto& c : arr) {
            ++idx;
            CameraConfig cc;
            cc.id = get_str(c, "id", "Camera " + std::to_string(idx));
            cc.host = get_str(c, "host", cc.host);
            cc.port = get_int(c, "port", cc.port);
            require_port(cc.port, "camera " + cc.id);

            if (!seen.insert(cc.id).second) {
                throw std::runtime_error ("[Config] duplicate camera id: " + cc.id);
            }
            cfg.cameras.push_back(std::move(cc));
        }
        return cfg;
    }
}
