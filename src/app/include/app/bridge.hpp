#pragma once
#include <atomic>
#include <cstdint>

namespace vcam::core { class JobSystem; }
namespace vcam::stream { class IFrameSource; }
namespace vcam::output { class IVirtualCamera; }

namespace vcam::app {

enum class BridgeExit {
    EndOfStream,    // source closed (a trailing partial frame counts as a clean end)
    Stopped,        // stop flag raised (signal)
    SourceError,
    SinkError,
    ConvertError,
    InvalidSetup    // context incomplete or source/camera geometry disagree
};

const char* bridge_exit_name(BridgeExit e) noexcept;

struct BridgeResult {
    BridgeExit exit = BridgeExit::EndOfStream;
    uint64_t frames_sent = 0;
    uint64_t late_frames = 0;
    double actual_fps = 0.0;       // measured by the pacer; 0 when pacing is off
    uint64_t timing_reports = 0;   // stage timing lines logged
};

// Everything the read-convert-send loop touches. Nothing here is owned; the caller keeps the
// source, camera, stop flag and job system alive for the duration of run_bridge().
struct BridgeContext {
    int width = 0;
    int height = 0;
    int fps = 15;
    stream::IFrameSource* source = nullptr;
    output::IVirtualCamera* camera = nullptr;
    const std::atomic<bool>* stop = nullptr;   // optional; checked before and after every read
    core::JobSystem* jobs = nullptr;           // optional; used when slices > 1
    int slices = 1;
    bool pace = true;                          // sleep to fps between frames
    bool timing = false;                       // periodic stage timing logs
    int progress_every = 0;                    // log progress every N frames; 0 = every fps frames
};

// Reads whole YUV420P frames from the source, converts them to the camera's pixel format and
// sends them until the stream ends, a stop is requested, or an I/O step fails.
BridgeResult run_bridge(BridgeContext& ctx);

bool is_clean_exit(BridgeExit e) noexcept;

} // namespace vcam::app
