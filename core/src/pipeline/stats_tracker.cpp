#include <pipeline/stats_tracker.hpp>

#include <algorithm>

namespace ci {
    StatsTracker::StatsTracker(std::string camera_id, std::chrono::milliseconds window)
        : window_(window) {
        stats_.camera_id = std::move(camera_id);
        window_start_ = Clock::now();
    }

    void StatsTracker::begin_session(Clock::time_point now) {
        std::lock_guard lk(mtx_);
        window_count_ = 0;
        window_start_ = now;
        stats_.client_connected = true;
        ++stats_.sessions_total;
    }

    void StatsTracker::end_session() {
        std::lock_guard lk(mtx_);
        stats_.client_connected = false;
    }

    double StatsTracker::latency_ms_(Clock::time_point now, Clock::time_point captured_at) {
        const double ms = std::chrono::duration<double, std::milli>(now - captured_at).count();
        return std::max(ms, 0.0);
    }

    void StatsTracker::on_frame(Clock::time_point now, Clock::time_point captured_at) {
        std::lock_guard lk(mtx_);
        ++window_count_;
        ++stats_.frames_total;

        const auto elapsed = now - window_start_;
        if (elapsed >= window_) {
            const double secs = std::chrono::duration<double>(elapsed).count();
            stats_.fps = static_cast<double>(window_count_) / secs;
            window_count_ = 0;
            window_start_ = now;
        }

        stats_.latency_ms = latency_ms_(now, captured_at);
        stats_.last_updated = now;
    }

    void StatsTracker::note_displayed(Clock::time_point now, Clock::time_point captured_at) {
        std::lock_guard lk(mtx_);
        stats_.latency_ms = latency_ms_(now, captured_at);
    }

    void StatsTracker::set_camera_id(const std::string& id) {
        std::lock_guard lk(mtx_);
        stats_.camera_id = id;
    }

    std::string StatsTracker::camera_id() const {
        std::lock_guard lk(mtx_);
        return stats_.camera_id;
    }

    StreamStats StatsTracker::snapshot() const {
        std::lock_guard lk(mtx_);
        return stats_;
    }
}
