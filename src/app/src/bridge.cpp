#include "app/bridge.hpp"
#include "convert/color_convert.hpp"
#include "convert/frame.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include "core/stage_timer.hpp"
#include "output/frame_pacer.hpp"
#include "output/virtual_camera.hpp"
#include "stream/frame_source.hpp"

#include <optional>
#include <string>

namespace vcam::app {

namespace {

bool stop_requested(const BridgeContext& ctx) {
    return ctx.stop && ctx.stop->load(std::memory_order_relaxed);
}

bool validate(const BridgeContext& ctx) {
    if (!ctx.source || !ctx.camera) {
        vcam::log::error("bridge: source and camera are required");
        return false;
    }
    if (ctx.width <= 0 || ctx.height <= 0 || ctx.width % 2 || ctx.height % 2) {
        vcam::log::error("bridge: frame size must be positive and even (got " + std::to_string(ctx.width) + "x" +
                         std::to_string(ctx.height) + ")");
        return false;
    }
    if (ctx.fps <= 0) {
        vcam::log::error("bridge: fps must be positive");
        return false;
    }
    const size_t expected_size = convert::yuv420p_frame_size(ctx.width, ctx.height);
    if (ctx.source->frame_size() != expected_size) {
        vcam::log::error("bridge: source frame size " + std::to_string(ctx.source->frame_size()) +
                         " does not match yuv420p " + std::to_string(expected_size));
        return false;
    }
    if (ctx.camera->width() != ctx.width || ctx.camera->height() != ctx.height) {
        vcam::log::error("bridge: camera is " + std::to_string(ctx.camera->width()) + "x" +
                         std::to_string(ctx.camera->height()) + ", frames are " + std::to_string(ctx.width) + "x" +
                         std::to_string(ctx.height));
        return false;
    }
    return true;
}

} // namespace

const char* bridge_exit_name(BridgeExit e) noexcept {
    switch (e) {
        case BridgeExit::EndOfStream: return "end-of-stream";
        case BridgeExit::Stopped: return "stopped";
        case BridgeExit::SourceError: return "source-error";
        case BridgeExit::SinkError: return "sink-error";
        case BridgeExit::ConvertError: return "convert-error";
        case BridgeExit::InvalidSetup: return "invalid-setup";
    }
    return "unknown";
}

bool is_clean_exit(BridgeExit e) noexcept {
    return e == BridgeExit::EndOfStream || e == BridgeExit::Stopped;
}

BridgeResult run_bridge(BridgeContext& ctx) {
    BridgeResult result;
    if (!validate(ctx)) {
        result.exit = BridgeExit::InvalidSetup;
        return result;
    }

    const convert::PixelFormat out_format = ctx.camera->format();
    const bool parallel = ctx.jobs != nullptr && ctx.slices > 1;
    const uint64_t progress_every = static_cast<uint64_t>(ctx.progress_every > 0 ? ctx.progress_every : ctx.fps);

    convert::VideoFrame yuv;
    yuv.width = ctx.width;
    yuv.height = ctx.height;
    yuv.format = convert::PixelFormat::YUV420P;

    output::FramePacer pacer;
    if (ctx.pace) pacer.start(ctx.fps);
    std::optional<core::StageTimer> timer;
    if (ctx.timing) timer.emplace(ctx.fps * 10);

    vcam::log::info("bridge: waiting for " + std::to_string(ctx.width) + "x" + std::to_string(ctx.height) +
                    " yuv420p frames (" + std::to_string(ctx.source->frame_size()) + " bytes each) @ " +
                    std::to_string(ctx.fps) + " fps");

    while (true) {
        if (stop_requested(ctx)) { result.exit = BridgeExit::Stopped; break; }
        if (timer) timer->begin();

        const stream::ReadStatus status = ctx.source->read_frame(yuv.data);
        if (status == stream::ReadStatus::EndOfStream) { result.exit = BridgeExit::EndOfStream; break; }
        if (status == stream::ReadStatus::Interrupted) { result.exit = BridgeExit::Stopped; break; }
        if (status != stream::ReadStatus::Frame) {
            vcam::log::error(std::string("bridge: source returned ") + stream::read_status_name(status));
            result.exit = BridgeExit::SourceError;
            break;
        }

        // A frame that arrived after the stop request is dropped, never half-delivered.
        if (stop_requested(ctx)) { result.exit = BridgeExit::Stopped; break; }
        if (timer) timer->afterRead();

        yuv.pts = static_cast<int64_t>(result.frames_sent * 1000000ull / static_cast<uint64_t>(ctx.fps));
        auto rgb = parallel ? convert::to_rgb_parallel(yuv, out_format, *ctx.jobs, ctx.slices)
                            : convert::to_rgb(yuv, out_format);
        if (!rgb) { result.exit = BridgeExit::ConvertError; break; }
        if (timer) timer->afterConversion();

        if (!ctx.camera->send(rgb->data.data(), rgb->data.size())) { result.exit = BridgeExit::SinkError; break; }
        if (timer) timer->afterSend();

        ++result.frames_sent;
        if (result.frames_sent % progress_every == 0) {
            vcam::log::info("bridge: " + std::to_string(result.frames_sent) + " frames delivered");
        }

        if (ctx.pace && !pacer.wait_next()) ++result.late_frames;
        if (timer) timer->endAndMaybeLog("bridge");
    }

    if (ctx.pace) {
        result.actual_fps = pacer.stats().actual_fps;
        pacer.stop();
    }
    if (timer) result.timing_reports = timer->reports();

    std::string summary = "bridge: " + std::string(bridge_exit_name(result.exit)) + " after " +
                          std::to_string(result.frames_sent) + " frames (" +
                          std::to_string(result.late_frames) + " late)";
    if (ctx.pace) summary += ", " + std::to_string(result.actual_fps) + " fps";
    if (is_clean_exit(result.exit)) vcam::log::info(summary);
    else vcam::log::error(summary);
    return result;
}

} // namespace vcam::app
