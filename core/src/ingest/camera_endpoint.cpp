#include <ingest/camera_endpoint.hpp>

#include <iostream>
#include <utility>
#include <vector>

#include <protocol/wire_protocol.hpp>

namespace ci {
    const char* to_string(EndpointState s) {
        switch (s) {
            case EndpointState::Idle: return "idle";
            case EndpointState::Listening: return "listening";
            case EndpointState::Stopped: return "stopped";
        }
        return "unknown";
    }

    CameraEndpoint::CameraEndpoint(std::string name, std::string host, int port, IngestConfig cfg)
        : name_(std::move(name)),
          host_(std::move(host)),
          port_(port),
          cfg_(cfg),
          stats_(name_) {}

    CameraEndpoint::~CameraEndpoint() {
        stop();
    }

    void CameraEndpoint::start() {
        std::lock_guard lk(lifecycle_mtx_);
        if (state_ == EndpointState::Listening) return;

        // previous session ended on a transport error
        if (accept_thr_.joinable()) accept_thr_.join();
        listener_.close();

        listener_ = TcpListener::bind(host_, port_);
        bound_port_ = listener_.port();

        running_ = true;
        state_ = EndpointState::Listening;
        accept_thr_ = std::thread([this] { accept_loop_(); });

        std::cout << tag_() << " listening on " << host_ << ":" << bound_port_.load() << "\n";
    }

    void CameraEndpoint::stop() {
        std::lock_guard lk(lifecycle_mtx_);
        if (!accept_thr_.joinable()) return;

        running_ = false;
        listener_.shutdown();
        {
            std::lock_guard clk(client_mtx_);
            if (client_) client_->shutdown();
        }

        accept_thr_.join();
        listener_.close();
        bound_port_ = 0;
        state_ = EndpointState::Stopped;

        std::cout << tag_() << " stopped\n";
    }

    void CameraEndpoint::accept_loop_() {
        const auto timeout = std::chrono::milliseconds(cfg_.accept_timeout_ms);

        while (running_.load(std::memory_order_relaxed)) {
            TcpSocket sock;
            const AcceptStatus st = listener_.accept(sock, timeout);
            if (!running_.load(std::memory_order_relaxed)) break;

            if (st == AcceptStatus::Timeout) continue;
            if (st == AcceptStatus::Error) {
                std::cerr << tag_() << " accept failed, listener closed until restarted\n";
                running_ = false;
                state_ = EndpointState::Stopped;
                break;
            }

            serve_client_(std::make_shared<TcpSocket>(std::move(sock)));
        }
    }

    bool CameraEndpoint::attach_client_(const std::shared_ptr<TcpSocket>& client) {
        std::lock_guard lk(client_mtx_);
        // stop() flips running_ before it looks at client_
        if (!running_.load()) return false;
        client_ = client;
        return true;
    }

    void CameraEndpoint::detach_client_() {
        std::lock_guard lk(client_mtx_);
        client_.reset();
    }

    bool CameraEndpoint::client_attached() const {
        std::lock_guard lk(client_mtx_);
        return client_ != nullptr;
    }

    void CameraEndpoint::serve_client_(const std::shared_ptr<TcpSocket>& client) {
        if (cfg_.tcp_nodelay) client->set_nodelay(true);
        client->set_buffer_sizes(cfg_.recv_buffer_bytes, cfg_.send_buffer_bytes);
        client->set_send_timeout(std::chrono::milliseconds(cfg_.read_timeout_ms));

        if (!attach_client_(client)) return;

        const std::string peer = client->peer();
        std::cout << tag_() << " client " << peer << " connected\n";
        stats_.begin_session(Clock::now());

        FrameReader reader(*client,
                           cfg_.limits,
                           std::chrono::milliseconds(cfg_.read_timeout_ms),
                           listener_.fd());

        std::string reason = "stopped";
        std::string camera_id = stats_.camera_id();

        const auto hs = reader.read_handshake();
        if (hs.status != ReadStatus::Ok) {
            reason = to_string(hs.status);
        } else {
            if (hs.handshake && hs.handshake->camera_id) {
                camera_id = *hs.handshake->camera_id;
                stats_.set_camera_id(camera_id);
                std::cout << tag_() << " handshake: camera_id=" << camera_id << "\n";
            } else if (hs.consumed && !hs.handshake) {
                std::cerr << tag_() << " ignored unparsable handshake, keeping camera_id=" << camera_id << "\n";
            }

            std::vector<uint8_t> payload;
            while (running_.load(std::memory_order_relaxed)) {
                const FrameStatus fs = reader.next(payload);

                if (fs == FrameStatus::Frame) {
                    const auto captured = Clock::now();
                    Frame f(std::make_shared<const std::vector<uint8_t>>(std::move(payload)),
                            captured,
                            next_frame_id_++,
                            camera_id);
                    payload = {};

                    buffer_.push(std::move(f));
                    stats_.on_frame(Clock::now(), captured);
                    continue;
                }

                if (fs == FrameStatus::Drained) {
                    std::cerr << tag_() << " discarded frame with invalid length " << reader.last_length() << "\n";
                    continue;
                }

                if (fs == FrameStatus::Corrupt) {
                    std::cerr << tag_() << " invalid frame length " << reader.last_length()
                              << ", closing session\n";
                }
                reason = to_string(fs);
                break;
            }
        }

        stats_.end_session();
        detach_client_();
        client->shutdown();
        std::cout << tag_() << " client " << peer << " disconnected (" << reason << ")\n";
    }

    void CameraEndpoint::note_displayed(const Frame& f) {
        stats_.note_displayed(Clock::now(), f.captured_at());
    }

    ControlSendResult CameraEndpoint::send_control(const ControlCommand& cmd) {
        std::shared_ptr<TcpSocket> client;
        {
            std::lock_guard lk(client_mtx_);
            client = client_;
        }
        if (!client) return ControlSendResult::NoClient;

        const std::string wire = cmd.wire();
        std::string err;
        bool ok = false;
        {
            std::lock_guard lk(send_mtx_);
            ok = client->write_all(wire.data(), wire.size(), &err);
        }

        if (!ok) {
            std::cerr << "[Control:" << name_ << "] failed to send " << cmd.text() << ": " << err << "\n";
            return ControlSendResult::Failed;
        }
        return ControlSendResult::Sent;
    }
}
