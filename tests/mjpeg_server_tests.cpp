#include <encode/mjpeg_server.hpp>
#include <ingest/camera_registry.hpp>
#include <pipeline/preview_relay.hpp>

#include "test_support.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using test::check;
using namespace std::chrono_literals;

namespace {
    void test_stats_json_shape() {
        ci::StreamStats s;
        s.camera_id = "Cam42";
        s.fps = 29.5;
        s.latency_ms = 12.0;
        s.frames_total = 100;
        const auto now = ci::Clock::now();
        s.last_updated = now - 100ms;

        auto j = nlohmann::json::parse(ci::PreviewRelay::stats_json(s, now, 2000ms));
        check(j["camera_id"] == "Cam42", "camera_id should be reported");
        check(j["fps"].get<double>() == 29.5, "fps should be reported");
        check(j["streaming"].get<bool>(), "fresh stats with fps > 0 count as streaming");
        check(j["age_ms"].get<int64_t>() >= 100, "age should reflect last_updated");

        s.last_updated = now - 3s;
        j = nlohmann::json::parse(ci::PreviewRelay::stats_json(s, now, 2000ms));
        check(!j["streaming"].get<bool>(), "stats older than 2s are not streaming");

        ci::StreamStats empty;
        j = nlohmann::json::parse(ci::PreviewRelay::stats_json(empty, now, 2000ms));
        check(j["age_ms"].is_null(), "no frames yet means no age");
        check(!j["streaming"].get<bool>(), "no frames yet means not streaming");
    }

    void test_gateway_end_to_end() {
        ci::CameraRegistry reg;
        reg.add("cam1", "127.0.0.1", 0);
        reg.start("cam1");

        ci::MJPEGServer server("127.0.0.1", 0);
        check(server.start(), "gateway should start");
        check(server.bound_port() > 0, "gateway should report its port");

        ci::IngestConfig cfg;
        ci::PreviewRelay relay(reg, server, cfg);
        relay.start();

        httplib::Client http("127.0.0.1", server.bound_port());
        http.set_read_timeout(2, 0);

        auto health = http.Get("/health");
        check(health && health->status == 200 && health->body == "ok", "/health should answer ok");

        auto streams = http.Get("/streams");
        check(streams && streams->status == 200, "/streams should answer");
        if (streams) {
            auto arr = nlohmann::json::parse(streams->body);
            check(arr.size() == 1 && arr[0] == "cam1", "/streams should list the registered camera");
        }

        auto none = http.Post("/control/cam1", "ZOOM:2.0", "text/plain");
        check(none && none->status == 202, "control without a client should be accepted as a no-op");

        auto client = test::connect_loopback(reg.bound_port("cam1"));
        test::send_message(client, R"({"camera_id":"Phone"})");
        test::send_message(client, "\xff\xd8jpeg\xff\xd9");

        check(test::wait_until([&] {
                  auto r = http.Get("/snapshot/cam1");
                  return r && r->status == 200;
              }),
              "snapshot should become available once a frame is relayed");
        auto snap = http.Get("/snapshot/cam1");
        check(snap && snap->body == "\xff\xd8jpeg\xff\xd9", "snapshot should be the raw payload");
        check(snap && snap->get_header_value("Content-Type") == "image/jpeg", "snapshot is served as jpeg");

        check(test::wait_until([&] {
                  auto r = http.Get("/stats/cam1");
                  if (!r || r->status != 200) return false;
                  auto j = nlohmann::json::parse(r->body, nullptr, false);
                  return !j.is_discarded() && j.value("camera_id", "") == "Phone";
              }),
              "stats should report the handshake identity");

        auto bad = http.Post("/control/cam1", "ZOOM:fast", "text/plain");
        check(bad && bad->status == 400, "an invalid command should be rejected");

        auto unknown = http.Post("/control/nope", "FLASH:ON", "text/plain");
        check(unknown && unknown->status == 404, "control for an unknown camera should be 404");

        auto sent = http.Post("/control/cam1", "FLASH:ON", "text/plain");
        check(sent && sent->status == 200, "control with a client attached should be sent");

        auto reset = http.Post("/control/cam1/reset", "", "text/plain");
        check(reset && reset->status == 200, "reset should send every default command");

        std::vector<std::string> lines;
        std::string line;
        uint8_t c = 0;
        while (lines.size() < 5 && client.read_exact(&c, 1, 2000ms) == ci::ReadStatus::Ok) {
            if (c == '\n') {
                lines.push_back(line);
                line.clear();
            } else {
                line.push_back(static_cast<char>(c));
            }
        }
        check(lines.size() == 5, "client should receive five command lines");
        if (lines.size() == 5) {
            check(lines[0] == "FLASH:ON", "explicit command comes first");
            check(lines[1] == "ZOOM:1.00", "reset sends zoom 1.0");
            check(lines[2] == "EXPOSURE:0", "reset sends exposure 0");
            check(lines[3] == "FOCUS:0.50", "reset sends focus 0.5");
            check(lines[4] == "FLASH:OFF", "reset turns the flash off");
        }

        relay.stop();
        server.stop();
        reg.stop_all();
    }

    void test_missing_stream_is_404() {
        ci::MJPEGServer server("127.0.0.1", 0);
        check(server.start(), "gateway should start");

        httplib::Client http("127.0.0.1", server.bound_port());
        auto r = http.Get("/snapshot/ghost");
        check(r && r->status == 404, "snapshot of an unknown stream is 404");

        server.register_stream("quiet");
        r = http.Get("/snapshot/quiet");
        check(r && r->status == 204, "snapshot of a stream without frames is 204");

        auto c = http.Post("/control/quiet", "FLASH:ON", "text/plain");
        check(c && c->status == 503, "control without a handler is unavailable");
        server.stop();
    }

    void test_restart_serves_again() {
        ci::MJPEGServer server("127.0.0.1", 0);
        server.register_stream("cam");
        check(server.start(), "gateway should start");
        server.stop();

        check(server.start(), "gateway should start again after stop");
        httplib::Client http("127.0.0.1", server.bound_port());
        http.set_read_timeout(2, 0);

        auto health = http.Get("/health");
        check(health && health->status == 200 && health->body == "ok", "/health answers after a restart");

        auto streams = http.Get("/streams");
        check(streams && streams->status == 200, "/streams answers after a restart");
        if (streams) {
            auto arr = nlohmann::json::parse(streams->body, nullptr, false);
            check(arr.is_array() && arr.size() == 1 && arr[0] == "cam", "streams survive a restart");
        }
        server.stop();
    }
}

int main() {
    test_stats_json_shape();
    test_gateway_end_to_end();
    test_missing_stream_is_404();
    test_restart_serves_again();

    return test::finish("mjpeg server tests");
}
