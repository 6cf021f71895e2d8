#include "convert/color_convert.hpp"
#include "convert/frame.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

// The transform relies on >> rounding toward negative infinity for negative intermediates.
// C++17 leaves this implementation-defined; refuse to build where it is not an arithmetic shift.
static_assert((-1 >> 1) == -1, "arithmetic right shift required for the fixed-point transform");
static_assert((-257 >> 8) == -2, "arithmetic right shift required for the fixed-point transform");

namespace vcam::convert {

namespace {
    inline uint8_t clamp8(int v) { return (v < 0) ? 0 : (v > 255 ? 255 : (uint8_t)v); }

    // BT.601 limited range, 8-bit fractional fixed point with +128 rounding bias.
    inline void yuv_to_rgb(int Y, int U, int V, uint8_t* out) {
        const int C = Y - 16;
        const int D = U - 128;
        const int E = V - 128;

        const int R = (298 * C + 409 * E + 128) >> 8;
        const int G = (298 * C - 100 * D - 208 * E + 128) >> 8;
        const int B = (298 * C + 516 * D + 128) >> 8;

        out[0] = clamp8(R);
        out[1] = clamp8(G);
        out[2] = clamp8(B);
    }

    bool valid_dims(int w, int h) { return w > 0 && h > 0 && (w % 2) == 0 && (h % 2) == 0; }

    bool check_request(const VideoFrame& src, PixelFormat dst_format, const char* who) {
        if (src.format != PixelFormat::YUV420P) {
            vcam::log::error(std::string(who) + ": source is " + pixel_format_name(src.format) + ", expected yuv420p");
            return false;
        }
        if (dst_format != PixelFormat::RGB24 && dst_format != PixelFormat::RGBA32) {
            vcam::log::error(std::string(who) + ": unsupported destination format " + pixel_format_name(dst_format));
            return false;
        }
        if (!valid_dims(src.width, src.height)) {
            vcam::log::error(std::string(who) + ": dimensions must be positive and even (got " +
                             std::to_string(src.width) + "x" + std::to_string(src.height) + ")");
            return false;
        }
        const size_t needed = yuv420p_frame_size(src.width, src.height);
        if (src.data.size() != needed) {
            vcam::log::error(std::string(who) + ": frame size mismatch (have=" + std::to_string(src.data.size()) +
                             ", need=" + std::to_string(needed) + ")");
            return false;
        }
        return true;
    }

    VideoFrame make_output(const VideoFrame& src, PixelFormat dst_format) {
        VideoFrame out;
        out.width = src.width;
        out.height = src.height;
        out.pts = src.pts;
        out.format = dst_format;
        out.data.resize(packed_frame_size(out.width, out.height, dst_format));
        return out;
    }
}

const char* pixel_format_name(PixelFormat fmt) noexcept {
    switch(fmt) {
        case PixelFormat::YUV420P: return "yuv420p";
        case PixelFormat::RGB24: return "rgb24";
        case PixelFormat::RGBA32: return "rgba32";
        case PixelFormat::BGRA32: return "bgra32";
        default: return "unknown";
    }
}

void yuv420p_to_rgb_rows(const uint8_t* src, int width, int height,
                         PixelFormat dst_format, uint8_t* dst,
                         int row_begin, int row_end) noexcept {
    const int W = width;
    const int H = height;
    const int CW = W / 2;
    const size_t y_size = static_cast<size_t>(W) * static_cast<size_t>(H);
    const size_t uv_size = static_cast<size_t>(CW) * static_cast<size_t>(H / 2);
    const uint8_t* Y_plane = src;
    const uint8_t* U_plane = Y_plane + y_size;
    const uint8_t* V_plane = U_plane + uv_size;

    const int bpp = bytes_per_pixel(dst_format);
    const bool alpha = (bpp == 4);

    row_begin = std::max(row_begin, 0);
    row_end = std::min(row_end, H);
    for (int y = row_begin; y < row_end; ++y) {
        const uint8_t* y_row = Y_plane + static_cast<size_t>(y) * W;
        const uint8_t* u_row = U_plane + static_cast<size_t>(y / 2) * CW;
        const uint8_t* v_row = V_plane + static_cast<size_t>(y / 2) * CW;
        uint8_t* out = dst + static_cast<size_t>(y) * W * bpp;
        for (int x = 0; x < W; ++x) {
            yuv_to_rgb(y_row[x], u_row[x / 2], v_row[x / 2], out);
            if (alpha) out[3] = 255;
            out += bpp;
        }
    }
}

void yuv420p_to_rgb(const uint8_t* src, int width, int height,
                    PixelFormat dst_format, uint8_t* dst) noexcept {
    yuv420p_to_rgb_rows(src, width, height, dst_format, dst, 0, height);
}

std::optional<VideoFrame> to_rgb(const VideoFrame& src, PixelFormat dst_format) noexcept {
    if (!check_request(src, dst_format, "to_rgb")) return std::nullopt;
    try {
        VideoFrame out = make_output(src, dst_format);
        yuv420p_to_rgb(src.data.data(), src.width, src.height, dst_format, out.data.data());
        return out;
    } catch (const std::exception& e) {
        vcam::log::error(std::string("to_rgb: ") + e.what());
        return std::nullopt;
    }
}

std::optional<VideoFrame> to_rgb_parallel(const VideoFrame& src, PixelFormat dst_format,
                                          core::JobSystem& jobs, int slices) noexcept {
    if (slices <= 1) return to_rgb(src, dst_format);
    if (!check_request(src, dst_format, "to_rgb_parallel")) return std::nullopt;

    // Bands are whole chroma rows (pairs of output rows).
    const int chroma_rows = src.height / 2;
    const int bands = std::min(slices, chroma_rows);
    const int band_rows = ((chroma_rows + bands - 1) / bands) * 2;

    try {
        VideoFrame out = make_output(src, dst_format);
        const uint8_t* in = src.data.data();
        uint8_t* dst = out.data.data();
        const int W = src.width;
        const int H = src.height;
        jobs.parallel_for(static_cast<size_t>(bands), [&](size_t band) {
            const int begin = static_cast<int>(band) * band_rows;
            yuv420p_to_rgb_rows(in, W, H, dst_format, dst, begin, begin + band_rows);
        });
        return out;
    } catch (const std::exception& e) {
        vcam::log::error(std::string("to_rgb_parallel: ") + e.what());
        return std::nullopt;
    }
}

void bgra_to_yuv420p(const uint8_t* src, int width, int height, uint8_t* dst) noexcept {
    const int half_w = width / 2;
    const size_t y_size = static_cast<size_t>(width) * static_cast<size_t>(height);
    const size_t uv_size = static_cast<size_t>(half_w) * static_cast<size_t>(height / 2);

    uint8_t* y_plane = dst;
    uint8_t* u_plane = dst + y_size;
    uint8_t* v_plane = u_plane + uv_size;

    for (int j = 0; j < height; ++j) {
        for (int i = 0; i < width; ++i) {
            const uint8_t* px = src + (static_cast<size_t>(j) * width + i) * 4;
            const int b = px[0];
            const int g = px[1];
            const int r = px[2];

            const int y = ((66 * r + 129 * g + 25 * b + 128) >> 8) + 16;
            y_plane[static_cast<size_t>(j) * width + i] = clamp8(y);

            // one chroma pair per 2x2 block, sampled at its top-left pixel
            if ((j & 1) == 0 && (i & 1) == 0) {
                const int u = ((-38 * r - 74 * g + 112 * b + 128) >> 8) + 128;
                const int v = ((112 * r - 94 * g - 18 * b + 128) >> 8) + 128;
                const size_t ci = static_cast<size_t>(j / 2) * half_w + (i / 2);
                u_plane[ci] = clamp8(u);
                v_plane[ci] = clamp8(v);
            }
        }
    }
}

} // namespace vcam::convert
