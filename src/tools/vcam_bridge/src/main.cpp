#include "app/bridge.hpp"
#include "app/config.hpp"
#include "convert/frame.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include "output/virtual_camera.hpp"
#include "stream/frame_source.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

namespace {

// Only state shared with the signal handler; the loop sees it through BridgeContext::stop.
std::atomic<bool> g_stop{false};
static_assert(std::atomic<bool>::is_always_lock_free, "stop flag must be async-signal-safe");

extern "C" void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked read() returns EINTR and the frame source reports Interrupted.
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        vcam::log::warn(std::string("vcam_bridge: cannot install signal handlers: ") + std::strerror(errno));
    }
    // A consumer closing the raw stdout pipe shows up as EPIPE from write().
    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        vcam::log::warn("vcam_bridge: cannot ignore SIGPIPE");
    }
}

int run(int argc, char** argv) {
    auto parsed = vcam::app::parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "error: " << parsed.error() << "\n\n" << vcam::app::usage(argv[0]);
        return 1;
    }
    const vcam::app::BridgeConfig& cfg = *parsed;
    if (cfg.show_help) {
        std::cout << vcam::app::usage(argv[0]);
        return 0;
    }

    vcam::log::set_level(cfg.log_level);
    vcam::log::set_json_mode(cfg.json_log);
    vcam::log::info("vcam_bridge: " + vcam::app::describe(cfg));

    install_signal_handlers();

    const size_t frame_size = vcam::convert::yuv420p_frame_size(cfg.width, cfg.height);
    auto source = vcam::stream::open_frame_source(cfg.input, frame_size, &g_stop);
    if (!source) {
        vcam::log::critical(source.error());
        return 2;
    }

    vcam::output::CameraParams params;
    params.device = cfg.device;
    params.width = cfg.width;
    params.height = cfg.height;
    params.fps = cfg.fps;
    params.format = cfg.format;
    // Opening the sink is one-shot setup: failure ends the process, no retry.
    auto camera = vcam::output::create_virtual_camera(params);
    if (!camera) {
        vcam::log::critical(camera.error());
        return 2;
    }

    vcam::core::JobSystem jobs;
    if (cfg.threads > 0) jobs.start(static_cast<unsigned>(cfg.threads));

    vcam::app::BridgeContext ctx;
    ctx.width = cfg.width;
    ctx.height = cfg.height;
    ctx.fps = cfg.fps;
    ctx.source = source->get();
    ctx.camera = camera->get();
    ctx.stop = &g_stop;
    ctx.jobs = cfg.threads > 0 ? &jobs : nullptr;
    ctx.slices = cfg.threads > 0 ? cfg.threads + 1 : 1;
    ctx.timing = cfg.timing;

    vcam::log::info("vcam_bridge: press Ctrl+C to stop");
    const vcam::app::BridgeResult result = vcam::app::run_bridge(ctx);
    jobs.stop();

    const auto& src_stats = (*source)->stats();
    if (src_stats.discarded_tail_bytes > 0) {
        vcam::log::warn("vcam_bridge: input ended mid-frame, " + std::to_string(src_stats.discarded_tail_bytes) +
                        " trailing bytes ignored");
    }
    return vcam::app::is_clean_exit(result.exit) ? 0 : 3;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "vcam_bridge: fatal: " << e.what() << std::endl;
        return 4;
    }
}
