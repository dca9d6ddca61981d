#pragma once

#include <stdexcept>
#include <string>

namespace ci {
    class DuplicateNameError : public std::runtime_error {
    public:
        explicit DuplicateNameError(const std::string& name)
            : std::runtime_error("[Registry] camera already exists: " + name) {}
    };

    class UnknownCameraError : public std::runtime_error {
    public:
        explicit UnknownCameraError(const std::string& name)
            : std::runtime_error("[Registry] unknown camera: " + name) {}
    };

    class BindError : public std::runtime_error {
    public:
        BindError(const std::string& host, int port, const std::string& reason)
            : std::runtime_error("bind " + host + ":" + std::to_string(port) + " failed: " + reason),
              host_(host),
              port_(port) {}

        const std::string& host() const { return host_; }
        int port() const { return port_; }

    private:
        std::string host_;
        int port_;
    };
}
