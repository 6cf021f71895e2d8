#pragma once
#include "convert/frame.hpp"
#include "core/expected.hpp"
#include "core/log.hpp"
#include <functional>
#include <string>

namespace vcam::app {

struct BridgeConfig {
    int width = 0;
    int height = 0;
    int fps = 15;
    std::string device = "/dev/video10";
    std::string input = "-";
    convert::PixelFormat format = convert::PixelFormat::RGB24;
    int threads = 0;                 // 0 = convert on the loop thread
    vcam::log::Level log_level = vcam::log::Level::Info;
    bool json_log = false;
    bool timing = false;
    bool show_help = false;
};

inline constexpr int kMaxFps = 240;
inline constexpr int kMaxDimension = 16384;
inline constexpr int kMaxThreads = 256;

// Environment lookup, injectable for tests. Defaults to std::getenv.
using EnvLookup = std::function<const char*(const char*)>;

// WIDTH HEIGHT [FPS] plus options; see usage(). Environment (VCAM_LOG_LEVEL, VCAM_LOG_JSON)
// is applied first so command-line options win.
expected<BridgeConfig, std::string> parse_args(int argc, const char* const* argv, const EnvLookup& env = {});

std::string usage(const char* prog);

// One-line summary for the startup log.
std::string describe(const BridgeConfig& cfg);

} // namespace vcam::app
