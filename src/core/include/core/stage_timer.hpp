#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "core/log.hpp"

namespace vcam::core {

// Per-frame stage timing for the bridge loop: read -> convert -> send -> pace.
// Averages are logged every log_every frames and then reset.
class StageTimer {
public:
    using clock = std::chrono::steady_clock;

    explicit StageTimer(int log_every = 120) : log_every_(log_every > 0 ? log_every : 1) {}

    void begin() { t0_ = clock::now(); }
    void afterRead() { t1_ = clock::now(); }
    void afterConversion() { t2_ = clock::now(); }
    void afterSend() { t3_ = clock::now(); }

    void endAndMaybeLog(const char* tag = "TIMING") {
        using std::chrono::duration_cast;
        using std::chrono::microseconds;

        const auto now = clock::now();

        read_sum_ += static_cast<double>(duration_cast<microseconds>(t1_ - t0_).count());
        convert_sum_ += static_cast<double>(duration_cast<microseconds>(t2_ - t1_).count());
        send_sum_ += static_cast<double>(duration_cast<microseconds>(t3_ - t2_).count());
        pace_sum_ += static_cast<double>(duration_cast<microseconds>(now - t3_).count());
        ++samples_;
        if (samples_ >= log_every_) {
            const double inv = 1.0 / static_cast<double>(samples_);
            vcam::log::info(std::string(tag) + " avg_us: read=" + std::to_string(read_sum_ * inv) +
                            " convert=" + std::to_string(convert_sum_ * inv) +
                            " send=" + std::to_string(send_sum_ * inv) +
                            " pace=" + std::to_string(pace_sum_ * inv));
            ++reports_;
            reset();
        }
    }

    uint64_t reports() const { return reports_; }

private:
    void reset() {
        samples_ = 0;
        read_sum_ = convert_sum_ = send_sum_ = pace_sum_ = 0.0;
    }

    int log_every_;
    int samples_{0};
    uint64_t reports_{0};
    double read_sum_{0.0};
    double convert_sum_{0.0};
    double send_sum_{0.0};
    double pace_sum_{0.0};

    clock::time_point t0_{};
    clock::time_point t1_{};
    clock::time_point t2_{};
    clock::time_point t3_{};
};

} // namespace vcam::core
