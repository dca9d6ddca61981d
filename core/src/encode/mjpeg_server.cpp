#include <encode/mjpeg_server.hpp>

#include <algorithm>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace ci {
    struct MJPEGServer::Impl {
        httplib::Server svr;
    };

    MJPEGServer::MJPEGServer(std::string host, int port)
        : impl_(std::make_unique<Impl>()),
          host_(std::move(host)),
          port_(port) {
        // handlers stay registered across stop()/start()
        install_routes_();
    }

    MJPEGServer::~MJPEGServer() {
        stop();
    }

    std::shared_ptr<MJPEGServer::StreamState> MJPEGServer::get_or_create_(const std::string& key) const {
        std::lock_guard lk(streams_mtx_);
        auto& p = streams_[key];
        if (!p) p = std::make_shared<StreamState>();
        return p;
    }

    std::shared_ptr<MJPEGServer::StreamState> MJPEGServer::get_(const std::string& key) const {
        std::lock_guard lk(streams_mtx_);
        auto it = streams_.find(key);
        if (it == streams_.end()) return nullptr;
        return it->second;
    }

    void MJPEGServer::push_jpeg(const std::string& stream_key,
                                std::shared_ptr<const std::vector<uint8_t>> jpeg) {
        auto st = get_or_create_(stream_key);
        {
            std::lock_guard lk(st->mtx);
            st->last_jpeg = std::move(jpeg);
            ++st->seq;
        }
        st->cv.notify_all();
    }

    void MJPEGServer::push_meta(const std::string& stream_key, std::string json) {
        auto st = get_or_create_(stream_key);
        std::lock_guard<std::mutex> lk(st->meta_mtx);
        st->last_meta = std::move(json);
    }

    void MJPEGServer::set_control_handler(ControlHandler h) {
        std::lock_guard lk(control_mtx_);
        control_ = std::move(h);
    }

    std::vector<std::string> MJPEGServer::list_streams() const {
        std::lock_guard lk(streams_mtx_);
        std::vector<std::string> out;
        out.reserve(streams_.size());
        for (const auto& kv : streams_) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

    MJPEGServer::ControlHandler MJPEGServer::control_handler_() const {
        std::lock_guard lk(control_mtx_);
        return control_;
    }

    void MJPEGServer::register_stream(const std::string& stream_key) {
        (void)get_or_create_(stream_key);
    }

    static int status_for(ControlSendResult r) {
        switch (r) {
            case ControlSendResult::Sent: return 200;
            case ControlSendResult::NoClient: return 202;
            case ControlSendResult::Failed: return 502;
        }
        return 500;
    }

    void MJPEGServer::install_routes_() {
        // /streams -> JSON list of camera names
        impl_->svr.Get("/streams", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json arr = list_streams();
            res.set_content(arr.dump(), "application/json");
            res.set_header("Cache-Control", "no-cache");
        });

        // /stats/<name>
        impl_->svr.Get(R"(/stats/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string key = req.matches[1];

            auto st = get_(key);
            if (!st) { res.status = 404; res.set_content("{}", "application/json"); return; }

            std::string json;
            {
                std::lock_guard<std::mutex> lk(st->meta_mtx);
                json = st->last_meta.empty() ? "{}" : st->last_meta;
            }

            res.set_content(json, "application/json");
            res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            res.set_header("Pragma", "no-cache");
        });

        // /snapshot/<name> -> last payload once
        impl_->svr.Get(R"(/snapshot/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string key = req.matches[1];

            auto st = get_(key);
            if (!st) { res.status = 404; return; }

            std::shared_ptr<const std::vector<uint8_t>> jpeg;
            {
                std::lock_guard<std::mutex> lk(st->mtx);
                jpeg = st->last_jpeg;
            }
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char *>(jpeg->data()), jpeg->size(), "image/jpeg");
            res.set_header("Cache-Control", "no-cache");
        });

        // /video/<name> -> MJPEG
        impl_->svr.Get(R"(/video/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string key = req.matches[1];

            auto st = get_(key);
            if (!st) { res.status = 404; return; }

            res.set_header("Cache-Control", "no-cache");
            res.set_header("Pragma", "no-cache");
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, st, boundary](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t last_sent = 0;
                    while (running_) {
                        std::shared_ptr<const std::vector<uint8_t>> jpeg;
                        uint64_t seq_local = 0;

                        {
                            std::unique_lock lk(st->mtx);
                            st->cv.wait(lk, [&] { return st->seq != last_sent || !running_; });
                            if (!running_) break;

                            jpeg = st->last_jpeg;
                            seq_local = st->seq;
                        }

                        last_sent = seq_local;
                        if (!jpeg || jpeg->empty()) continue;

                        std::string header =
                            "--" + boundary + "\r\n"
                            "Content-Type: image/jpeg\r\n"
                            "Content-Length: " + std::to_string(jpeg->size()) + "\r\n\r\n";

                        if (!sink.write(header.data(), header.size())) return false;
                        if (!sink.write(reinterpret_cast<const char *>(jpeg->data()), jpeg->size())) return false;
                        if (!sink.write("\r\n", 2)) return false;
                    }

                    sink.done();
                    return true;
                }
            );
        });

        // /control/<name>/reset -> default zoom/exposure/focus/flash
        impl_->svr.Post(R"(/control/(.+)/reset)", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string key = req.matches[1];

            const ControlHandler h = control_handler_();
            if (!h) { res.status = 503; return; }

            ControlSendResult worst = ControlSendResult::Sent;
            for (const auto& cmd : ControlCommand::defaults()) {
                auto r = h(key, cmd);
                if (!r) { res.status = 404; return; }
                if (*r == ControlSendResult::Failed) worst = *r;
                else if (*r == ControlSendResult::NoClient && worst == ControlSendResult::Sent) worst = *r;
            }
            res.status = status_for(worst);
            res.set_content(to_string(worst), "text/plain");
        });

        // /control/<name>, body: ZOOM:1.5 | EXPOSURE:-2 | FOCUS:0.3 | FLASH:ON
        impl_->svr.Post(R"(/control/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string key = req.matches[1];

            auto cmd = ControlCommand::parse(req.body);
            if (!cmd) {
                res.status = 400;
                res.set_content("invalid command", "text/plain");
                return;
            }

            const ControlHandler h = control_handler_();
            if (!h) { res.status = 503; return; }

            auto r = h(key, *cmd);
            if (!r) { res.status = 404; return; }
            res.status = status_for(*r);
            res.set_content(to_string(*r), "text/plain");
        });

        impl_->svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
    }

    bool MJPEGServer::start() {
        if (running_) return true;

        bound_port_ = 0;
        if (port_ == 0) {
            bound_port_ = impl_->svr.bind_to_any_port(host_);
            if (bound_port_ <= 0) bound_port_ = 0;
        } else if (impl_->svr.bind_to_port(host_, port_)) {
            bound_port_ = port_;
        }

        if (bound_port_ == 0) {
            std::cerr << "[Gateway] failed to bind " << host_ << ":" << port_ << "\n";
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this] {
            std::cout << "[Gateway] Streams list: http://" << host_ << ":" << bound_port_ << "/streams\n";
            std::cout << "[Gateway] Video: http://" << host_ << ":" << bound_port_ << "/video/<camera>\n";
            impl_->svr.listen_after_bind();
        });

        return true;
    }

    void MJPEGServer::stop() {
        if (!running_) return;
        running_ = false;

        {
            std::lock_guard lk(streams_mtx_);
            for (auto& kv : streams_) {
                // taking the lock orders this against a waiter checking running_
                { std::lock_guard slk(kv.second->mtx); }
                kv.second->cv.notify_all();
            }
        }

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
