#pragma once
#include "convert/frame.hpp"
#include "core/expected.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace vcam::output {

struct CameraParams {
    std::string device = "/dev/video10"; // "-" writes raw frames to stdout
    int width = 0;
    int height = 0;
    int fps = 15;
    convert::PixelFormat format = convert::PixelFormat::RGB24;
};

struct CameraStats {
    uint64_t frames_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t rejected_frames = 0; // wrong size handed to send()
};

// Sink for interleaved RGB frames. The pixel format is fixed when the sink is opened;
// callers must convert to format() before send().
class IVirtualCamera {
public:
    virtual ~IVirtualCamera() = default;
    virtual convert::PixelFormat format() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual const std::string& device() const = 0;
    // Delivers one whole frame. size must equal packed_frame_size(width, height, format).
    virtual bool send(const uint8_t* data, std::size_t size) = 0;
    virtual const CameraStats& stats() const = 0;
};

// Writes whole frames to a descriptor. Shared by the v4l2 loopback sink and the raw sink.
class FdCamera final : public IVirtualCamera {
public:
    FdCamera(int fd, bool owns_fd, const CameraParams& params);
    ~FdCamera() override;
    FdCamera(const FdCamera&) = delete;
    FdCamera& operator=(const FdCamera&) = delete;

    convert::PixelFormat format() const override { return params_.format; }
    int width() const override { return params_.width; }
    int height() const override { return params_.height; }
    const std::string& device() const override { return params_.device; }
    bool send(const uint8_t* data, std::size_t size) override;
    const CameraStats& stats() const override { return stats_; }

private:
    int fd_;
    bool owns_fd_;
    CameraParams params_;
    std::size_t frame_size_;
    CameraStats stats_;
};

// Opens a v4l2loopback device as a video output and declares RGB24 or RGBA32.
// Fails when the device cannot be opened or the driver does not accept the format.
expected<std::unique_ptr<IVirtualCamera>, std::string> open_v4l2_loopback(const CameraParams& params);

// Raw interleaved frames on stdout, for piping into another consumer.
std::unique_ptr<IVirtualCamera> open_stdout_camera(const CameraParams& params);

// Validates params and picks the sink from params.device.
expected<std::unique_ptr<IVirtualCamera>, std::string> create_virtual_camera(const CameraParams& params);

} // namespace vcam::output
