#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include <pipeline/types.hpp>

namespace ci {
    // Single slot shared by the ingest thread (push) and the consumer (pop).
    // A push always overwrites, so the consumer only ever sees the newest frame.
    class LatestFrameBuffer {
    public:
        LatestFrameBuffer() = default;

        LatestFrameBuffer(const LatestFrameBuffer&) = delete;
        LatestFrameBuffer& operator=(const LatestFrameBuffer&) = delete;

        void push(Frame f) {
            std::lock_guard lk(m_);
            if (slot_) ++dropped_;
            slot_ = std::move(f);
        }

        std::optional<Frame> pop() {
            std::lock_guard lk(m_);
            std::optional<Frame> out;
            out.swap(slot_);
            return out;
        }

        std::optional<Frame> peek() const {
            std::lock_guard lk(m_);
            return slot_;
        }

        bool has_frame() const {
            std::lock_guard lk(m_);
            return slot_.has_value();
        }

        // frames replaced before anyone popped them
        uint64_t dropped() const {
            std::lock_guard lk(m_);
            return dropped_;
        }

        void clear() {
            std::lock_guard lk(m_);
            slot_.reset();
        }

    private:
        mutable std::mutex m_;
        std::optional<Frame> slot_;
        uint64_t dropped_ = 0;
    };
}
