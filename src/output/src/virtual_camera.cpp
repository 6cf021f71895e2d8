#include "output/virtual_camera.hpp"
#include "core/log.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace vcam::output {

FdCamera::FdCamera(int fd, bool owns_fd, const CameraParams& params)
    : fd_(fd), owns_fd_(owns_fd), params_(params),
      frame_size_(convert::packed_frame_size(params.width, params.height, params.format)) {}

FdCamera::~FdCamera() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
}

bool FdCamera::send(const uint8_t* data, std::size_t size) {
    if (size != frame_size_ || data == nullptr) {
        ++stats_.rejected_frames;
        vcam::log::error("camera " + params_.device + ": frame size mismatch (have=" + std::to_string(size) +
                         ", need=" + std::to_string(frame_size_) + ")");
        return false;
    }

    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            vcam::log::error("camera " + params_.device + ": write failed: " + std::strerror(errno));
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    ++stats_.frames_sent;
    stats_.bytes_sent += written;
    return true;
}

std::unique_ptr<IVirtualCamera> open_stdout_camera(const CameraParams& params) {
    vcam::log::info("camera: raw " + std::string(convert::pixel_format_name(params.format)) + " " +
                    std::to_string(params.width) + "x" + std::to_string(params.height) + " -> stdout");
    return std::make_unique<FdCamera>(STDOUT_FILENO, false, params);
}

expected<std::unique_ptr<IVirtualCamera>, std::string> create_virtual_camera(const CameraParams& params) {
    if (params.width <= 0 || params.height <= 0)
        return make_unexpected(std::string("camera dimensions must be positive"));
    if (params.width % 2 != 0 || params.height % 2 != 0)
        return make_unexpected(std::string("camera dimensions must be even"));
    if (params.format != convert::PixelFormat::RGB24 && params.format != convert::PixelFormat::RGBA32)
        return make_unexpected("camera format must be rgb24 or rgba32, got " +
                               std::string(convert::pixel_format_name(params.format)));
    if (params.device.empty())
        return make_unexpected(std::string("no camera device given"));

    if (params.device == "-") return open_stdout_camera(params);
    return open_v4l2_loopback(params);
}

} // namespace vcam::output
