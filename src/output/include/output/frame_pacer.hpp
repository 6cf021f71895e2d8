#pragma once
#include <cstdint>
#include <chrono>
#include <thread>

namespace vcam::output {

// Paces frame delivery to a fixed rate. Frame n is due at start + n * period; a frame that
// is more than one period late re-anchors the schedule at the current time instead of
// bursting to catch up.
class FramePacer {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t frames = 0;
        uint64_t late_frames = 0;
        double actual_fps = 0.0;
    };

    void start(int fps) {
        fps_ = fps > 0 ? fps : 1;
        period_ = std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(1000000000LL / fps_));
        start_wall_ = Clock::now();
        next_due_ = start_wall_ + period_;
        stats_ = Stats{};
        running_ = true;
    }

    void stop() { running_ = false; }
    bool running() const { return running_; }

    // Blocks until the next frame slot. Returns false if the slot had already passed
    // by more than one period (the frame is late).
    bool wait_next() {
        if (!running_) return true;
        ++stats_.frames;

        const auto now = Clock::now();
        bool on_time = true;
        if (now < next_due_) {
            std::this_thread::sleep_until(next_due_);
        } else if (now - next_due_ > period_) {
            ++stats_.late_frames;
            next_due_ = now;
            on_time = false;
        }
        next_due_ += period_;

        const double elapsed_s = std::chrono::duration<double>(Clock::now() - start_wall_).count();
        if (elapsed_s > 0.0) stats_.actual_fps = static_cast<double>(stats_.frames) / elapsed_s;
        return on_time;
    }

    Clock::duration frame_period() const { return period_; }
    int fps() const { return fps_; }
    const Stats& stats() const { return stats_; }

private:
    bool running_ = false;
    int fps_ = 0;
    Clock::duration period_{};
    Clock::time_point start_wall_{};
    Clock::time_point next_due_{};
    Stats stats_{};
};

} // namespace vcam::output
