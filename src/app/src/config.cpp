#include "app/config.hpp"
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace vcam::app {

namespace {

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

expected<convert::PixelFormat, std::string> parse_format(const std::string& name) {
    if (name == "rgb24" || name == "rgb") return convert::PixelFormat::RGB24;
    if (name == "rgba" || name == "rgba32") return convert::PixelFormat::RGBA32;
    return make_unexpected("unknown format '" + name + "' (expected rgb24 or rgba)");
}

} // namespace

std::string usage(const char* prog) {
    std::ostringstream oss;
    oss << "Usage: " << (prog ? prog : "vcam_bridge") << " [OPTIONS] WIDTH HEIGHT [FPS]\n"
        << "\n"
        << "Read raw YUV420P frames (WIDTH*HEIGHT*3/2 bytes each) and feed them to a virtual camera.\n"
        << "\n"
        << "Options:\n"
        << "  -d, --device PATH     v4l2loopback device, '-' for raw frames on stdout  [/dev/video10]\n"
        << "  -i, --input PATH      YUV420P source, '-' for stdin                    [-]\n"
        << "  -f, --fps N           target frame rate (1-" << kMaxFps << ")                     [15]\n"
        << "      --format FMT      sink pixel format: rgb24 | rgba                   [rgb24]\n"
        << "  -j, --threads N       convert on N worker threads (0 = inline)          [0]\n"
        << "      --log-level LVL   trace|debug|info|warn|error|critical              [info]\n"
        << "      --json-log        JSON-lines log output\n"
        << "      --timing          log per-stage timing averages\n"
        << "  -h, --help            show this help\n"
        << "\n"
        << "Environment: VCAM_LOG_LEVEL, VCAM_LOG_JSON\n";
    return oss.str();
}

expected<BridgeConfig, std::string> parse_args(int argc, const char* const* argv, const EnvLookup& env) {
    BridgeConfig cfg;
    auto lookup = [&](const char* name) -> const char* {
        return env ? env(name) : std::getenv(name);
    };

    if (const char* lvl = lookup("VCAM_LOG_LEVEL")) {
        if (auto parsed = vcam::log::parse_level(lvl)) cfg.log_level = *parsed;
        else return make_unexpected("VCAM_LOG_LEVEL: unknown level '" + std::string(lvl) + "'");
    }
    if (const char* json = lookup("VCAM_LOG_JSON")) {
        cfg.json_log = std::string(json) != "0";
    }

    std::vector<std::string> positional;
    bool fps_option = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? argv[i] : "";
        auto next_value = [&](std::string& value) -> bool {
            if (i + 1 >= argc || argv[i + 1] == nullptr) return false;
            value = argv[++i];
            return true;
        };

        if (a == "-h" || a == "--help") { cfg.show_help = true; return cfg; }

        if (a == "-d" || a == "--device" || a == "-i" || a == "--input" || a == "-f" || a == "--fps" ||
            a == "--format" || a == "-j" || a == "--threads" || a == "--log-level") {
            std::string value;
            if (!next_value(value)) return make_unexpected("option " + a + " requires a value");

            if (a == "-d" || a == "--device") {
                cfg.device = value;
            } else if (a == "-i" || a == "--input") {
                cfg.input = value;
            } else if (a == "-f" || a == "--fps") {
                if (!parse_int(value, cfg.fps)) return make_unexpected("invalid fps '" + value + "'");
                fps_option = true;
            } else if (a == "--format") {
                auto fmt = parse_format(value);
                if (!fmt) return make_unexpected(fmt.error());
                cfg.format = *fmt;
            } else if (a == "-j" || a == "--threads") {
                if (!parse_int(value, cfg.threads)) return make_unexpected("invalid thread count '" + value + "'");
            } else {
                auto lvl = vcam::log::parse_level(value);
                if (!lvl) return make_unexpected("unknown log level '" + value + "'");
                cfg.log_level = *lvl;
            }
            continue;
        }
        if (a == "--json-log") { cfg.json_log = true; continue; }
        if (a == "--timing") { cfg.timing = true; continue; }
        if (a.size() > 1 && a[0] == '-') return make_unexpected("unknown option " + a);

        positional.push_back(a);
    }

    if (positional.size() < 2) return make_unexpected(std::string("WIDTH and HEIGHT are required"));
    if (positional.size() > 3) return make_unexpected("unexpected argument '" + positional[3] + "'");

    if (!parse_int(positional[0], cfg.width)) return make_unexpected("invalid width '" + positional[0] + "'");
    if (!parse_int(positional[1], cfg.height)) return make_unexpected("invalid height '" + positional[1] + "'");
    if (positional.size() == 3) {
        if (fps_option) return make_unexpected(std::string("fps given both as option and positional argument"));
        if (!parse_int(positional[2], cfg.fps)) return make_unexpected("invalid fps '" + positional[2] + "'");
    }

    // 4:2:0 chroma planes are (W/2)x(H/2); odd sizes cannot be framed exactly.
    if (cfg.width <= 0 || cfg.height <= 0) return make_unexpected(std::string("WIDTH and HEIGHT must be positive"));
    if (cfg.width > kMaxDimension || cfg.height > kMaxDimension)
        return make_unexpected("WIDTH and HEIGHT must not exceed " + std::to_string(kMaxDimension));
    if (cfg.width % 2 != 0 || cfg.height % 2 != 0)
        return make_unexpected("WIDTH and HEIGHT must be even for yuv420p (got " + std::to_string(cfg.width) + "x" +
                               std::to_string(cfg.height) + ")");
    if (cfg.fps < 1 || cfg.fps > kMaxFps)
        return make_unexpected("fps must be 1-" + std::to_string(kMaxFps) + " (got " + std::to_string(cfg.fps) + ")");
    if (cfg.threads < 0 || cfg.threads > kMaxThreads)
        return make_unexpected("threads must be 0-" + std::to_string(kMaxThreads));
    if (cfg.device.empty()) return make_unexpected(std::string("device must not be empty"));
    if (cfg.input.empty()) return make_unexpected(std::string("input must not be empty"));

    return cfg;
}

std::string describe(const BridgeConfig& cfg) {
    return std::to_string(cfg.width) + "x" + std::to_string(cfg.height) + " @ " + std::to_string(cfg.fps) +
           " fps, " + (cfg.input == "-" ? std::string("stdin") : cfg.input) + " -> " + cfg.device + " (" +
           convert::pixel_format_name(cfg.format) + (cfg.threads > 0 ? ", " + std::to_string(cfg.threads) + " threads" : std::string()) + ")";
}

} // namespace vcam::app
