#include "convert/color_convert.hpp"
#include "convert/frame.hpp"
#include "core/log.hpp"

#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Synthetic YUV420P producer: scrolling colour bars on stdout, for feeding vcam_bridge
// without a capture source.
//   vcam_pattern 640 480 300 | vcam_bridge 640 480 30

namespace {

// 75% bars: white, yellow, cyan, green, magenta, red, blue, black (B,G,R)
constexpr uint8_t kBars[8][3] = {
    {191, 191, 191}, {0, 191, 191}, {191, 191, 0}, {0, 191, 0},
    {191, 0, 191},   {0, 0, 191},   {191, 0, 0},   {0, 0, 0},
};

void render_bars(std::vector<uint8_t>& bgra, int width, int height, uint64_t frame) {
    const int shift = static_cast<int>((frame * 4) % static_cast<uint64_t>(width));
    for (int y = 0; y < height; ++y) {
        uint8_t* row = bgra.data() + static_cast<size_t>(y) * width * 4;
        for (int x = 0; x < width; ++x) {
            const int bar = (((x + shift) % width) * 8) / width;
            row[x * 4 + 0] = kBars[bar][0];
            row[x * 4 + 1] = kBars[bar][1];
            row[x * 4 + 2] = kBars[bar][2];
            row[x * 4 + 3] = 255;
        }
    }
}

bool write_all(int fd, const uint8_t* data, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool parse_positive(const char* text, long long& out) {
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(text, &end, 10);
    return errno == 0 && end != text && *end == '\0' && out >= 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: vcam_pattern WIDTH HEIGHT [FRAMES]\n"
                  << "Writes YUV420P colour bars to stdout (FRAMES=0 or omitted: until the reader goes away).\n";
        return 1;
    }
    long long w = 0, h = 0, frames = 0;
    if (!parse_positive(argv[1], w) || !parse_positive(argv[2], h) || (argc == 4 && !parse_positive(argv[3], frames))) {
        std::cerr << "error: WIDTH, HEIGHT and FRAMES must be non-negative integers\n";
        return 1;
    }
    if (w <= 0 || h <= 0 || w % 2 || h % 2 || w > 16384 || h > 16384) {
        std::cerr << "error: WIDTH and HEIGHT must be even and between 2 and 16384\n";
        return 1;
    }
    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        vcam::log::warn("vcam_pattern: cannot ignore SIGPIPE");
    }

    const int width = static_cast<int>(w);
    const int height = static_cast<int>(h);
    std::vector<uint8_t> bgra(vcam::convert::packed_frame_size(width, height, vcam::convert::PixelFormat::BGRA32));
    std::vector<uint8_t> yuv(vcam::convert::yuv420p_frame_size(width, height));

    vcam::log::info("vcam_pattern: " + std::to_string(width) + "x" + std::to_string(height) + " yuv420p, " +
                    (frames > 0 ? std::to_string(frames) + " frames" : std::string("endless")));

    uint64_t n = 0;
    for (; frames == 0 || n < static_cast<uint64_t>(frames); ++n) {
        render_bars(bgra, width, height, n);
        vcam::convert::bgra_to_yuv420p(bgra.data(), width, height, yuv.data());
        if (!write_all(STDOUT_FILENO, yuv.data(), yuv.size())) {
            if (errno == EPIPE) break;  // reader closed the pipe
            vcam::log::error(std::string("vcam_pattern: write failed: ") + std::strerror(errno));
            return 3;
        }
    }
    vcam::log::info("vcam_pattern: wrote " + std::to_string(n) + " frames");
    return 0;
}
