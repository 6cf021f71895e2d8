// v4l2loopback output sink (Linux).
#include "output/virtual_camera.hpp"
#include "core/log.hpp"

#include <linux/videodev2.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstring>
#include <limits>

namespace vcam::output {

namespace {

// Retry ioctl if interrupted by a signal (SIGINT arrives while the device is being set up).
int xioctl(int fd, unsigned long req, void* arg) {
    int r;
    do { r = ::ioctl(fd, req, arg); }
    while (r == -1 && errno == EINTR);
    return r;
}

uint32_t v4l2_fourcc_for(convert::PixelFormat fmt) {
    switch (fmt) {
        case convert::PixelFormat::RGB24: return V4L2_PIX_FMT_RGB24;
        case convert::PixelFormat::RGBA32: return V4L2_PIX_FMT_RGBA32;
        default: return 0;
    }
}

} // namespace

expected<std::unique_ptr<IVirtualCamera>, std::string> open_v4l2_loopback(const CameraParams& params) {
    const uint32_t fourcc = v4l2_fourcc_for(params.format);
    if (fourcc == 0)
        return make_unexpected("v4l2: unsupported pixel format " + std::string(convert::pixel_format_name(params.format)));

    const std::size_t bytesperline = static_cast<std::size_t>(params.width) *
                                     static_cast<std::size_t>(convert::bytes_per_pixel(params.format));
    const std::size_t sizeimage = convert::packed_frame_size(params.width, params.height, params.format);
    if (sizeimage > std::numeric_limits<uint32_t>::max())
        return make_unexpected("v4l2: frame of " + std::to_string(sizeimage) + " bytes exceeds the driver limit");

    const int fd = ::open(params.device.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0)
        return make_unexpected("v4l2: cannot open " + params.device + ": " + std::strerror(errno));

    // From here on the camera owns fd and closes it on every failure path.
    auto cam = std::make_unique<FdCamera>(fd, true, params);

    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_OUTPUT;
    fmt.fmt.pix.width = static_cast<uint32_t>(params.width);
    fmt.fmt.pix.height = static_cast<uint32_t>(params.height);
    fmt.fmt.pix.pixelformat = fourcc;
    fmt.fmt.pix.field = V4L2_FIELD_NONE;
    fmt.fmt.pix.bytesperline = static_cast<uint32_t>(bytesperline);
    fmt.fmt.pix.sizeimage = static_cast<uint32_t>(sizeimage);
    fmt.fmt.pix.colorspace = V4L2_COLORSPACE_SRGB;

    if (xioctl(fd, VIDIOC_S_FMT, &fmt) == -1)
        return make_unexpected("v4l2: VIDIOC_S_FMT failed on " + params.device + ": " + std::strerror(errno));

    // The driver may adjust the request; frames are only valid for an exact match.
    if (fmt.fmt.pix.pixelformat != fourcc)
        return make_unexpected("v4l2: " + params.device + " rejected pixel format " +
                               std::string(convert::pixel_format_name(params.format)));
    if (fmt.fmt.pix.width != static_cast<uint32_t>(params.width) ||
        fmt.fmt.pix.height != static_cast<uint32_t>(params.height))
        return make_unexpected("v4l2: " + params.device + " negotiated " + std::to_string(fmt.fmt.pix.width) + "x" +
                               std::to_string(fmt.fmt.pix.height) + " instead of " + std::to_string(params.width) +
                               "x" + std::to_string(params.height));

    // Frame interval hint for consumers; loopback drivers without S_PARM support are fine.
    v4l2_streamparm parm{};
    parm.type = V4L2_BUF_TYPE_VIDEO_OUTPUT;
    parm.parm.output.timeperframe.numerator = 1;
    parm.parm.output.timeperframe.denominator = static_cast<uint32_t>(params.fps > 0 ? params.fps : 15);
    if (xioctl(fd, VIDIOC_S_PARM, &parm) == -1) {
        vcam::log::debug("v4l2: VIDIOC_S_PARM not supported on " + params.device + ": " + std::strerror(errno));
    }

    vcam::log::info("v4l2: opened " + params.device + " " + std::to_string(params.width) + "x" +
                    std::to_string(params.height) + " " + convert::pixel_format_name(params.format));
    return std::unique_ptr<IVirtualCamera>(std::move(cam));
}

} // namespace vcam::output
