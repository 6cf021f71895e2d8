#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vcam::convert {

enum class PixelFormat {
    Unknown,

    // Planar 4:2:0, Y then U then V, no padding (I420)
    YUV420P,

    // Interleaved 8-bit
    RGB24,      // R,G,B
    RGBA32,     // R,G,B,A (A = 255 on conversion output)
    BGRA32      // B,G,R,A (screen-capture layout, input of the forward transform)
};

struct VideoFrame {
    int64_t pts = 0; // in microseconds
    int32_t width = 0;
    int32_t height = 0;
    PixelFormat format = PixelFormat::Unknown;
    std::vector<uint8_t> data;
};

// Bytes of one tightly packed YUV420P frame: W*H luma + two (W/2)*(H/2) chroma planes.
// Only exact for even dimensions.
constexpr std::size_t yuv420p_frame_size(int width, int height) noexcept {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
         + 2 * (static_cast<std::size_t>(width / 2) * static_cast<std::size_t>(height / 2));
}

constexpr int bytes_per_pixel(PixelFormat fmt) noexcept {
    switch(fmt) {
        case PixelFormat::RGB24: return 3;
        case PixelFormat::RGBA32: return 4;
        case PixelFormat::BGRA32: return 4;
        default: return 0;
    }
}

// Bytes of one interleaved frame; 0 for planar or unknown formats.
constexpr std::size_t packed_frame_size(int width, int height, PixelFormat fmt) noexcept {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
         * static_cast<std::size_t>(bytes_per_pixel(fmt));
}

const char* pixel_format_name(PixelFormat fmt) noexcept;

} // namespace vcam::convert
