#include <ingest/camera_registry.hpp>

#include <common/errors.hpp>

#include <iostream>

namespace ci {
    CameraRegistry::CameraRegistry(IngestConfig cfg) : cfg_(cfg) {}

    CameraRegistry::~CameraRegistry() {
        stop_all();
    }

    std::shared_ptr<CameraEndpoint> CameraRegistry::get_(const std::string& name) const {
        std::lock_guard lk(mtx_);
        auto it = endpoints_.find(name);
        if (it == endpoints_.end()) return nullptr;
        return it->second;
    }

    void CameraRegistry::add(const std::string& name, const std::string& host, int port) {
        std::lock_guard lk(mtx_);
        if (endpoints_.count(name)) throw DuplicateNameError(name);
        endpoints_.emplace(name, std::make_shared<CameraEndpoint>(name, host, port, cfg_));
        std::cout << "[Registry] added " << name << " (" << host << ":" << port << ")\n";
    }

    void CameraRegistry::start(const std::string& name) {
        auto ep = get_(name);
        if (!ep) throw UnknownCameraError(name);
        ep->start();
    }

    void CameraRegistry::stop(const std::string& name) {
        if (auto ep = get_(name)) ep->stop();
    }

    void CameraRegistry::stop_all() {
        std::vector<std::shared_ptr<CameraEndpoint>> eps;
        {
            std::lock_guard lk(mtx_);
            for (const auto& kv : endpoints_) eps.push_back(kv.second);
        }
        for (auto& ep : eps) ep->stop();
    }

    std::optional<Frame> CameraRegistry::poll_frame(const std::string& name) {
        auto ep = get_(name);
        if (!ep) return std::nullopt;
        return ep->poll_frame();
    }

    std::optional<Frame> CameraRegistry::peek_frame(const std::string& name) const {
        auto ep = get_(name);
        if (!ep) return std::nullopt;
        return ep->peek_frame();
    }

    std::optional<StreamStats> CameraRegistry::get_stats(const std::string& name) const {
        auto ep = get_(name);
        if (!ep) return std::nullopt;
        return ep->stats();
    }

    void CameraRegistry::note_displayed(const std::string& name, const Frame& f) {
        if (auto ep = get_(name)) ep->note_displayed(f);
    }

    ControlSendResult CameraRegistry::send_control(const std::string& name, const ControlCommand& cmd) {
        auto ep = get_(name);
        if (!ep) return ControlSendResult::NoClient;
        return ep->send_control(cmd);
    }

    bool CameraRegistry::contains(const std::string& name) const {
        std::lock_guard lk(mtx_);
        return endpoints_.count(name) != 0;
    }

    std::optional<EndpointState> CameraRegistry::state(const std::string& name) const {
        auto ep = get_(name);
        if (!ep) return std::nullopt;
        return ep->state();
    }

    int CameraRegistry::bound_port(const std::string& name) const {
        auto ep = get_(name);
        return ep ? ep->bound_port() : 0;
    }

    std::vector<std::string> CameraRegistry::names() const {
        std::lock_guard lk(mtx_);
        std::vector<std::string> out;
        out.reserve(endpoints_.size());
        for (const auto& kv : endpoints_) out.push_back(kv.first);
        return out;
    }
}
