#include <catch2/catch_test_macros.hpp>
#include "app/bridge.hpp"
#include "convert/frame.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include "output/virtual_camera.hpp"
#include "stream/frame_source.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

using namespace vcam;
using convert::PixelFormat;

namespace {

// Serves `frames` flat frames of luma `y`, then end of stream. Optionally raises a stop flag
// while the given frame index is being read.
class MemorySource : public stream::IFrameSource {
public:
    MemorySource(int w, int h, int frames, uint8_t y = 16)
        : w_(w), h_(h), frames_(frames), y_(y), size_(convert::yuv420p_frame_size(w, h)) {}

    stream::ReadStatus read_frame(std::vector<uint8_t>& out) override {
        if (fail_at_ >= 0 && served_ == fail_at_) return stream::ReadStatus::Error;
        if (interrupt_at_ >= 0 && served_ == interrupt_at_) return stream::ReadStatus::Interrupted;
        if (served_ >= frames_) return stream::ReadStatus::EndOfStream;
        if (stop_ && served_ == stop_at_) stop_->store(true);
        const size_t luma = static_cast<size_t>(w_) * h_;
        out.assign(size_, 128);
        std::fill(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(luma), y_);
        ++served_;
        ++stats_.frames_read;
        return stream::ReadStatus::Frame;
    }
    size_t frame_size() const override { return size_; }
    const stream::SourceStats& stats() const override { return stats_; }

    void stop_during(int index, std::atomic<bool>* flag) { stop_at_ = index; stop_ = flag; }
    void fail_at(int index) { fail_at_ = index; }
    void interrupt_at(int index) { interrupt_at_ = index; }

private:
    int w_, h_, frames_;
    uint8_t y_;
    size_t size_;
    int served_ = 0;
    int stop_at_ = -1;
    int fail_at_ = -1;
    int interrupt_at_ = -1;
    std::atomic<bool>* stop_ = nullptr;
    stream::SourceStats stats_;
};

class MemoryCamera : public output::IVirtualCamera {
public:
    MemoryCamera(int w, int h, PixelFormat fmt) : w_(w), h_(h), fmt_(fmt) {}

    PixelFormat format() const override { return fmt_; }
    int width() const override { return w_; }
    int height() const override { return h_; }
    const std::string& device() const override { return name_; }
    bool send(const uint8_t* data, size_t size) override {
        if (fail_after_ >= 0 && static_cast<int>(frames.size()) >= fail_after_) return false;
        frames.emplace_back(data, data + size);
        ++stats_.frames_sent;
        stats_.bytes_sent += size;
        return true;
    }
    const output::CameraStats& stats() const override { return stats_; }

    void fail_after(int n) { fail_after_ = n; }

    std::vector<std::vector<uint8_t>> frames;

private:
    int w_, h_;
    PixelFormat fmt_;
    std::string name_ = "memory";
    int fail_after_ = -1;
    output::CameraStats stats_;
};

app::BridgeContext make_context(int w, int h, stream::IFrameSource& src, output::IVirtualCamera& cam) {
    app::BridgeContext ctx;
    ctx.width = w;
    ctx.height = h;
    ctx.fps = 30;
    ctx.source = &src;
    ctx.camera = &cam;
    ctx.pace = false;
    return ctx;
}

} // namespace

TEST_CASE("Bridge delivers every frame then reports end of stream", "[bridge]") {
    MemorySource src(4, 2, 5, 235);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);

    auto result = app::run_bridge(ctx);
    REQUIRE(result.exit == app::BridgeExit::EndOfStream);
    REQUIRE(app::is_clean_exit(result.exit));
    REQUIRE(result.frames_sent == 5);
    REQUIRE(cam.frames.size() == 5);
    for (const auto& f : cam.frames) REQUIRE(f == std::vector<uint8_t>(24, 255));
}

TEST_CASE("Bridge converts to the camera's pixel format", "[bridge]") {
    MemorySource src(4, 2, 2, 16);
    MemoryCamera cam(4, 2, PixelFormat::RGBA32);
    auto ctx = make_context(4, 2, src, cam);

    auto result = app::run_bridge(ctx);
    REQUIRE(result.frames_sent == 2);
    REQUIRE(cam.frames[0].size() == 32);
    REQUIRE(cam.frames[0][3] == 255);
    REQUIRE(cam.frames[0][0] == 0);
}

TEST_CASE("Bridge with worker slices matches the serial path", "[bridge]") {
    core::JobSystem jobs;
    jobs.start(2);
    MemorySource src(16, 8, 3, 100);
    MemoryCamera cam(16, 8, PixelFormat::RGB24);
    auto ctx = make_context(16, 8, src, cam);
    ctx.jobs = &jobs;
    ctx.slices = 3;

    auto result = app::run_bridge(ctx);
    REQUIRE(result.exit == app::BridgeExit::EndOfStream);
    REQUIRE(cam.frames.size() == 3);
    // Y=100, U=V=128 -> (298*84+128)>>8 = 98
    for (uint8_t b : cam.frames[2]) REQUIRE(b == 98);
    jobs.stop();
}

TEST_CASE("Stop request drops the frame being read", "[bridge]") {
    std::atomic<bool> stop{false};
    MemorySource src(4, 2, 10);
    src.stop_during(3, &stop);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);
    ctx.stop = &stop;

    auto result = app::run_bridge(ctx);
    REQUIRE(result.exit == app::BridgeExit::Stopped);
    REQUIRE(app::is_clean_exit(result.exit));
    REQUIRE(result.frames_sent == 3);
    REQUIRE(cam.frames.size() == 3);
}

TEST_CASE("Stop before the first read sends nothing", "[bridge]") {
    std::atomic<bool> stop{true};
    MemorySource src(4, 2, 10);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);
    ctx.stop = &stop;

    auto result = app::run_bridge(ctx);
    REQUIRE(result.exit == app::BridgeExit::Stopped);
    REQUIRE(cam.frames.empty());
}

TEST_CASE("Interrupted read stops cleanly", "[bridge]") {
    SECTION("before the first frame") {
        MemorySource src(4, 2, 10);
        src.interrupt_at(0);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        auto result = app::run_bridge(ctx);
        REQUIRE(result.exit == app::BridgeExit::Stopped);
        REQUIRE(app::is_clean_exit(result.exit));
        REQUIRE(result.frames_sent == 0);
        REQUIRE(cam.frames.empty());
    }
    SECTION("mid-stream") {
        MemorySource src(4, 2, 10);
        src.interrupt_at(3);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        auto result = app::run_bridge(ctx);
        REQUIRE(result.exit == app::BridgeExit::Stopped);
        REQUIRE(result.frames_sent == 3);
    }
}

TEST_CASE("Source and sink failures end the loop", "[bridge]") {
    SECTION("sink") {
        MemorySource src(4, 2, 10);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        cam.fail_after(2);
        auto ctx = make_context(4, 2, src, cam);
        auto result = app::run_bridge(ctx);
        REQUIRE(result.exit == app::BridgeExit::SinkError);
        REQUIRE_FALSE(app::is_clean_exit(result.exit));
        REQUIRE(result.frames_sent == 2);
    }
    SECTION("source") {
        MemorySource src(4, 2, 10);
        src.fail_at(4);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        auto result = app::run_bridge(ctx);
        REQUIRE(result.exit == app::BridgeExit::SourceError);
        REQUIRE(result.frames_sent == 4);
    }
}

TEST_CASE("Mismatched setup is rejected before reading", "[bridge]") {
    SECTION("camera geometry") {
        MemorySource src(4, 2, 1);
        MemoryCamera cam(8, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        REQUIRE(app::run_bridge(ctx).exit == app::BridgeExit::InvalidSetup);
    }
    SECTION("source frame size") {
        MemorySource src(8, 4, 1);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        REQUIRE(app::run_bridge(ctx).exit == app::BridgeExit::InvalidSetup);
    }
    SECTION("missing camera") {
        MemorySource src(4, 2, 1);
        MemoryCamera cam(4, 2, PixelFormat::RGB24);
        auto ctx = make_context(4, 2, src, cam);
        ctx.camera = nullptr;
        REQUIRE(app::run_bridge(ctx).exit == app::BridgeExit::InvalidSetup);
    }
    SECTION("odd frame size") {
        MemorySource src(3, 2, 1);
        MemoryCamera cam(3, 2, PixelFormat::RGB24);
        auto ctx = make_context(3, 2, src, cam);
        REQUIRE(app::run_bridge(ctx).exit == app::BridgeExit::InvalidSetup);
    }
}

TEST_CASE("Exit names are stable", "[bridge]") {
    REQUIRE(std::string(app::bridge_exit_name(app::BridgeExit::EndOfStream)) == "end-of-stream");
    REQUIRE(std::string(app::bridge_exit_name(app::BridgeExit::SinkError)) == "sink-error");
}

TEST_CASE("Stage timing is logged every ten seconds of frames", "[bridge][timing]") {
    std::vector<std::string> lines;
    vcam::log::set_sink([&](vcam::log::Level, const std::string& msg) { lines.push_back(msg); });

    MemorySource src(4, 2, 25);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);
    ctx.fps = 1;          // report every 10 frames
    ctx.timing = true;
    auto result = app::run_bridge(ctx);
    vcam::log::set_sink({});

    REQUIRE(result.exit == app::BridgeExit::EndOfStream);
    REQUIRE(result.frames_sent == 25);
    REQUIRE(result.timing_reports == 2);
    size_t timing_lines = 0;
    for (const auto& l : lines) {
        if (l.find("bridge avg_us:") != std::string::npos) ++timing_lines;
    }
    REQUIRE(timing_lines == 2);
}

TEST_CASE("Timing is off by default", "[bridge][timing]") {
    MemorySource src(4, 2, 25);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);
    ctx.fps = 1;
    REQUIRE(app::run_bridge(ctx).timing_reports == 0);
}

TEST_CASE("Paced run reports the measured rate", "[bridge][pacer]") {
    MemorySource src(4, 2, 3);
    MemoryCamera cam(4, 2, PixelFormat::RGB24);
    auto ctx = make_context(4, 2, src, cam);
    ctx.fps = 100;
    ctx.pace = true;
    auto result = app::run_bridge(ctx);
    REQUIRE(result.frames_sent == 3);
    REQUIRE(result.actual_fps > 0.0);
    REQUIRE(result.actual_fps <= 110.0);
}
