#include <pipeline/latest_frame_buffer.hpp>

#include "test_support.hpp"

#include <atomic>
#include <thread>
#include <type_traits>
#include <utility>

using test::check;

namespace {
    ci::Frame make_frame(int64_t id, const std::string& body) {
        return ci::Frame(std::make_shared<const std::vector<uint8_t>>(body.begin(), body.end()),
                         ci::Clock::now(), id, "cam");
    }

    void test_frame_fields_fixed_at_construction() {
        static_assert(std::is_const_v<std::remove_reference_t<decltype(std::declval<ci::Frame&>().payload())>>,
                      "payload handle is read-only");
        static_assert(std::is_const_v<std::remove_reference_t<decltype(std::declval<ci::Frame&>().camera_id())>>,
                      "camera id is read-only");

        const auto t = ci::Clock::now();
        const ci::Frame f(std::make_shared<const std::vector<uint8_t>>(3, 0xd8), t, 42, "Cam42");
        const ci::Frame copy = f;

        check(copy.payload() == f.payload(), "copies share the payload bytes");
        check(copy.captured_at() == t && copy.frame_id() == 42 && copy.camera_id() == "Cam42",
              "a copy keeps the construction values");
        check(f.size() == 3 && !f.empty(), "size reflects the payload");
        check(ci::Frame().empty(), "a default frame is empty");
    }

    void test_latest_wins() {
        ci::LatestFrameBuffer buf;
        buf.push(make_frame(1, "A"));
        buf.push(make_frame(2, "B"));

        auto f = buf.pop();
        check(f.has_value(), "pop after two pushes should return a frame");
        check(f && f->frame_id() == 2, "pop should return the newest frame");
        check(f && test::as_string(*f->payload()) == "B", "payload of the newest frame should be intact");
        check(!buf.pop().has_value(), "second pop should report empty");
        check(buf.dropped() == 1, "the overwritten frame should be counted as dropped");
    }

    void test_empty_pop_and_peek() {
        ci::LatestFrameBuffer buf;
        check(!buf.pop().has_value(), "pop on a fresh buffer should be empty");
        check(!buf.has_frame(), "fresh buffer holds nothing");

        buf.push(make_frame(7, "xyz"));
        auto p = buf.peek();
        check(p && p->frame_id() == 7, "peek should return the held frame");
        check(buf.has_frame(), "peek should not remove the frame");

        buf.clear();
        check(!buf.has_frame(), "clear should empty the slot");
    }

    void test_concurrent_push_pop_never_tears() {
        ci::LatestFrameBuffer buf;
        std::atomic<bool> done{false};
        std::atomic<int> bad{0};
        std::atomic<int> popped{0};

        std::thread producer([&] {
            for (int i = 1; i <= 20000; ++i) {
                buf.push(make_frame(i, std::string(static_cast<size_t>(i % 64) + 1, static_cast<char>('a' + (i % 26)))));
            }
            done = true;
        });

        int64_t last = 0;
        while (!done || buf.has_frame()) {
            auto f = buf.pop();
            if (!f) continue;
            ++popped;
            const size_t expect_len = static_cast<size_t>(f->frame_id() % 64) + 1;
            const char expect_ch = static_cast<char>('a' + (f->frame_id() % 26));
            if (f->payload()->size() != expect_len) ++bad;
            for (auto c : *f->payload()) {
                if (static_cast<char>(c) != expect_ch) { ++bad; break; }
            }
            if (f->frame_id() <= last) ++bad;
            last = f->frame_id();
        }
        producer.join();

        check(bad == 0, "consumer should only see whole frames in increasing order");
        check(popped > 0, "consumer should have popped at least one frame");
        check(last == 20000, "the final frame should be the last one pushed");
    }
}

int main() {
    test_frame_fields_fixed_at_construction();
    test_latest_wins();
    test_empty_pop_and_peek();
    test_concurrent_push_pop_never_tears();

    return test::finish("latest frame buffer tests");
}
