#include <pipeline/preview_relay.hpp>

#include <iostream>

#include <nlohmann/json.hpp>

namespace ci {
    PreviewRelay::PreviewRelay(CameraRegistry& registry, MJPEGServer& server, IngestConfig cfg)
        : registry_(registry),
          server_(server),
          cfg_(cfg) {}

    bool PreviewRelay::start() {
        if (running_) return true;

        for (const auto& name : registry_.names()) server_.register_stream(name);

        server_.set_control_handler(
            [this](const std::string& name, const ControlCommand& cmd) -> std::optional<ControlSendResult> {
                if (!registry_.contains(name)) return std::nullopt;
                const auto r = registry_.send_control(name, cmd);
                std::cout << "[Control:" << name << "] " << cmd.text() << " -> " << to_string(r) << "\n";
                return r;
            });

        running_ = true;
        thr_ = std::thread([this] { loop_(); });
        return true;
    }

    void PreviewRelay::stop() {
        if (!running_) return;
        running_ = false;
        if (thr_.joinable()) thr_.join();
        server_.set_control_handler(nullptr);
    }

    int PreviewRelay::poll_once() {
        int relayed = 0;
        for (const auto& name : registry_.names()) {
            auto f = registry_.poll_frame(name);
            if (!f || f->empty()) continue;

            server_.push_jpeg(name, f->payload());
            registry_.note_displayed(name, *f);
            ++relayed;
        }
        return relayed;
    }

    void PreviewRelay::publish_stats_once() {
        const auto now = Clock::now();
        const auto stale = std::chrono::milliseconds(cfg_.stale_after_ms);
        for (const auto& name : registry_.names()) {
            auto s = registry_.get_stats(name);
            if (!s) continue;
            server_.push_meta(name, stats_json(*s, now, stale));
        }
    }

    std::string PreviewRelay::stats_json(const StreamStats& s,
                                         Clock::time_point now,
                                         std::chrono::milliseconds stale_after) {
        const bool streaming = !s.is_stale(now, stale_after) && s.fps > 0.0;

        nlohmann::json j;
        j["camera_id"] = s.camera_id;
        j["fps"] = s.fps;
        j["latency_ms"] = s.latency_ms;
        if (s.frames_total > 0) {
            j["age_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(now - s.last_updated).count();
        } else {
            j["age_ms"] = nullptr;
        }
        j["frames_total"] = s.frames_total;
        j["sessions_total"] = s.sessions_total;
        j["client_connected"] = s.client_connected;
        j["streaming"] = streaming;
        return j.dump();
    }

    void PreviewRelay::loop_() {
        const auto poll_every = std::chrono::milliseconds(cfg_.poll_interval_ms);
        const auto stats_every = std::chrono::milliseconds(cfg_.stats_interval_ms);

        auto next_stats = Clock::now();
        while (running_.load(std::memory_order_relaxed)) {
            poll_once();

            const auto now = Clock::now();
            if (now >= next_stats) {
                publish_stats_once();
                next_stats = now + stats_every;
            }
            std::this_thread::sleep_for(poll_every);
        }
    }
}
