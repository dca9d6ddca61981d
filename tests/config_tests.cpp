#include <common/config.hpp>

#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using test::check;

namespace {
    std::string write_yaml_file(const std::string& prefix, const std::string& body) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + ".yaml");

        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open temp config file: " + path.string());
        }
        out << body;
        out.close();
        return path.string();
    }

    bool load_throws(const std::string& yaml) {
        const std::string path = write_yaml_file("ci_cfg", yaml);
        try {
            (void)ci::load_config_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            return true;
        }
    }

    void test_default_config_has_one_camera() {
        const auto cfg = ci::default_config();
        check(cfg.cameras.size() == 1, "default config should define one camera");
        check(cfg.cameras[0].id == "Camera 1", "default camera should be named Camera 1");
        check(cfg.cameras[0].host == "0.0.0.0", "default camera should bind all interfaces");
        check(cfg.cameras[0].port == 5000, "default camera should listen on 5000");
        check(cfg.ingest.limits.max_frame_bytes == 5u * 1024u * 1024u, "default frame limit is 5 MiB");
        check(cfg.ingest.limits.oversize == ci::OversizePolicy::Close, "default oversize policy is close");
        check(cfg.ingest.accept_timeout_ms == 1000, "default accept timeout is 1s");
    }

    void test_full_config_loads() {
        const std::string yaml =
            "server:\n"
            "  host: \"127.0.0.1\"\n"
            "  port: 9090\n"
            "ingest:\n"
            "  read_timeout_ms: 3000\n"
            "  oversize_policy: \"drain\"\n"
            "  max_frame_bytes: 1048576\n"
            "cameras:\n"
            "  - id: \"front\"\n"
            "    port: 5000\n"
            "  - id: \"back\"\n"
            "    host: \"127.0.0.1\"\n"
            "    port: 5001\n";

        const std::string path = write_yaml_file("ci_cfg_ok", yaml);
        const auto cfg = ci::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.server.url == "127.0.0.1", "server host should be read");
        check(cfg.server.port == 9090, "server port should be read");
        check(cfg.ingest.read_timeout_ms == 3000, "read timeout should be read");
        check(cfg.ingest.accept_timeout_ms == 1000, "unset accept timeout keeps its default");
        check(cfg.ingest.limits.oversize == ci::OversizePolicy::Drain, "oversize policy should be read");
        check(cfg.ingest.limits.max_frame_bytes == 1048576u, "frame limit should be read");
        check(cfg.cameras.size() == 2, "two cameras should be loaded");
        check(cfg.cameras[0].host == "0.0.0.0", "camera host defaults to 0.0.0.0");
        check(cfg.cameras[1].id == "back" && cfg.cameras[1].port == 5001, "second camera should be read");
    }

    void test_missing_cameras_falls_back_to_default() {
        const std::string yaml =
            "server:\n"
            "  port: 8081\n";

        const std::string path = write_yaml_file("ci_cfg_nocam", yaml);
        const auto cfg = ci::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.cameras.size() == 1 && cfg.cameras[0].id == "Camera 1",
              "config without cameras should use the default camera");
    }

    void test_config_rejects_duplicate_ids() {
        const std::string yaml =
            "cameras:\n"
            "  - id: \"cam\"\n"
            "    port: 5000\n"
            "  - id: \"cam\"\n"
            "    port: 5001\n";

        check(load_throws(yaml), "load_config_yaml should reject duplicate camera ids");
    }

    void test_config_rejects_bad_values() {
        check(load_throws("cameras:\n  - id: \"a\"\n    port: 70000\n"),
              "load_config_yaml should reject ports above 65535");
        check(load_throws("ingest:\n  oversize_policy: \"skip\"\n"),
              "load_config_yaml should reject unknown oversize policies");
        check(load_throws("ingest:\n  read_timeout_ms: 0\n"),
              "load_config_yaml should reject a zero read timeout");
        check(load_throws("cameras: []\n"),
              "load_config_yaml should reject an empty camera list");
        check(load_throws("ingest:\n  max_frame_bytes: 512\n  max_handshake_bytes: 1024\n"),
              "load_config_yaml should reject a handshake limit above the frame limit");
        check(!load_throws("ingest:\n  max_frame_bytes: 1024\n  max_handshake_bytes: 1024\n"),
              "equal handshake and frame limits are accepted");
    }
}

int main() {
    test_default_config_has_one_camera();
    test_full_config_loads();
    test_missing_cameras_falls_back_to_default();
    test_config_rejects_duplicate_ids();
    test_config_rejects_bad_values();

    return test::finish("config tests");
}
