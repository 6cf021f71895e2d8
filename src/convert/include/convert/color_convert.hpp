#pragma once
#include "frame.hpp"
#include <cstdint>
#include <optional>

namespace vcam::core { class JobSystem; }

namespace vcam::convert {

// YUV420P -> RGB24/RGBA32 using the BT.601 limited-range fixed-point inverse transform
// with nearest-neighbour chroma upsampling.
//
// Preconditions (not checked): width and height positive and even, src holds
// yuv420p_frame_size(width, height) bytes, dst holds packed_frame_size(width, height, dst_format)
// bytes, dst_format is RGB24 or RGBA32. Stateless and safe to call concurrently on
// independent buffers.
void yuv420p_to_rgb(const uint8_t* src, int width, int height,
                    PixelFormat dst_format, uint8_t* dst) noexcept;

// Same transform restricted to output rows [row_begin, row_end). Used to slice a frame
// across workers; every row only reads the input, so bands can be converted in any order.
void yuv420p_to_rgb_rows(const uint8_t* src, int width, int height,
                         PixelFormat dst_format, uint8_t* dst,
                         int row_begin, int row_end) noexcept;

// Checked wrapper for a whole frame. Returns std::nullopt (and logs) when the source is not
// YUV420P, the destination format is unsupported, the dimensions are not positive and even,
// or the buffer size is not exactly one frame.
std::optional<VideoFrame> to_rgb(const VideoFrame& src, PixelFormat dst_format) noexcept;

// Bit-identical to to_rgb, with the rows split into `slices` bands on the job system.
// Band boundaries fall on even rows so no chroma row is shared between bands.
std::optional<VideoFrame> to_rgb_parallel(const VideoFrame& src, PixelFormat dst_format,
                                          core::JobSystem& jobs, int slices) noexcept;

// BGRA -> YUV420P with BT.601 limited-range coefficients. Chroma is taken from the
// top-left pixel of each 2x2 block. dst must hold yuv420p_frame_size(width, height) bytes.
void bgra_to_yuv420p(const uint8_t* src, int width, int height, uint8_t* dst) noexcept;

}
