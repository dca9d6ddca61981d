#include <common/config.hpp>
#include <common/errors.hpp>
#include <encode/mjpeg_server.hpp>
#include <ingest/camera_registry.hpp>
#include <pipeline/preview_relay.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    ci::AppConfig cfg;
    if (argc >= 2) {
        try {
            cfg = ci::load_config_yaml(argv[1]);
        } catch (const YAML::Exception& e) {
            std::cerr << "Config error: " << e.what() << "\n";
            return 1;
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    } else {
        std::cerr << "No config given, using Camera 1 on 0.0.0.0:5000\n";
        cfg = ci::default_config();
    }

    ci::CameraRegistry registry(cfg.ingest);
    size_t started = 0;
    for (const auto& cam : cfg.cameras) {
        try {
            registry.add(cam.id, cam.host, cam.port);
            registry.start(cam.id);
            ++started;
        } catch (const ci::BindError& e) {
            std::cerr << "[Registry] " << cam.id << ": " << e.what() << "\n";
        } catch (const ci::DuplicateNameError& e) {
            std::cerr << e.what() << "\n";
        }
    }

    if (started == 0) {
        std::cerr << "No camera endpoint could be started\n";
        return 1;
    }

    std::unique_ptr<ci::MJPEGServer> server;
    std::unique_ptr<ci::PreviewRelay> relay;
    if (cfg.server.enabled) {
        server = std::make_unique<ci::MJPEGServer>(cfg.server.url, cfg.server.port);
        if (!server->start()) {
            registry.stop_all();
            return 1;
        }
        relay = std::make_unique<ci::PreviewRelay>(registry, *server, cfg.ingest);
        relay->start();
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    if (relay) relay->stop();
    if (server) server->stop();
    registry.stop_all();

    return 0;
}
