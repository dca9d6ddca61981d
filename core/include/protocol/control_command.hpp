#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ci {
    enum class ControlKind {
        Zoom,
        Exposure,
        Focus,
        Flash,
    };

    // One reverse-channel command, already serialized to its wire text
    // (without the trailing newline).
    class ControlCommand {
    public:
        static ControlCommand zoom(float factor);
        static ControlCommand exposure(int compensation);
        static ControlCommand focus(float distance);
        static ControlCommand flash(bool on);

        // Accepts "ZOOM:<float>", "EXPOSURE:<int>", "FOCUS:<float>", "FLASH:ON|OFF".
        // Surrounding whitespace is ignored, anything else yields nullopt.
        static std::optional<ControlCommand> parse(const std::string& text);

        // ZOOM 1.0, EXPOSURE 0, FOCUS 0.5, FLASH OFF
        static std::vector<ControlCommand> defaults();

        ControlKind kind() const { return kind_; }
        const std::string& text() const { return text_; }

        // newline-terminated form written to the socket
        std::string wire() const { return text_ + "\n"; }

    private:
        ControlCommand(ControlKind kind, std::string text)
            : kind_(kind), text_(std::move(text)) {}

        ControlKind kind_;
        std::string text_;
    };

    enum class ControlSendResult {
        Sent,
        NoClient,
        Failed,
    };

    const char* to_string(ControlSendResult r);
}
