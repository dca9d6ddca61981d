#include <protocol/control_command.hpp>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace ci {
    static std::string format_float(const char* prefix, float v) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%s:%.2f", prefix, static_cast<double>(v));
        return buf;
    }

    static std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    static std::optional<float> parse_float(const std::string& s) {
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
        return static_cast<float>(v);
    }

    static std::optional<int> parse_int(const std::string& s) {
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        const long v = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
        if (v < -1000000 || v > 1000000) return std::nullopt;
        return static_cast<int>(v);
    }

    ControlCommand ControlCommand::zoom(float factor) {
        return ControlCommand(ControlKind::Zoom, format_float("ZOOM", factor));
    }

    ControlCommand ControlCommand::exposure(int compensation) {
        return ControlCommand(ControlKind::Exposure, "EXPOSURE:" + std::to_string(compensation));
    }

    ControlCommand ControlCommand::focus(float distance) {
        return ControlCommand(ControlKind::Focus, format_float("FOCUS", distance));
    }

    ControlCommand ControlCommand::flash(bool on) {
        return ControlCommand(ControlKind::Flash, on ? "FLASH:ON" : "FLASH:OFF");
    }

    std::optional<ControlCommand> ControlCommand::parse(const std::string& text) {
        const std::string t = trim(text);
        const auto colon = t.find(':');
        if (colon == std::string::npos) return std::nullopt;

        const std::string key = t.substr(0, colon);
        const std::string value = t.substr(colon + 1);

        if (key == "ZOOM") {
            if (auto v = parse_float(value)) return zoom(*v);
        } else if (key == "FOCUS") {
            if (auto v = parse_float(value)) return focus(*v);
        } else if (key == "EXPOSURE") {
            if (auto v = parse_int(value)) return exposure(*v);
        } else if (key == "FLASH") {
            if (value == "ON") return flash(true);
            if (value == "OFF") return flash(false);
        }
        return std::nullopt;
    }

    std::vector<ControlCommand> ControlCommand::defaults() {
        return {zoom(1.0f), exposure(0), focus(0.5f), flash(false)};
    }

    const char* to_string(ControlSendResult r) {
        switch (r) {
            case ControlSendResult::Sent: return "sent";
            case ControlSendResult::NoClient: return "no_client";
            case ControlSendResult::Failed: return "failed";
        }
        return "unknown";
    }
}
