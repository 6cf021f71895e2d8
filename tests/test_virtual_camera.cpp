#include <catch2/catch_test_macros.hpp>
#include "output/virtual_camera.hpp"

#include <unistd.h>
#include <vector>

using namespace vcam::output;
using vcam::convert::PixelFormat;

namespace {

CameraParams params_for(int w, int h, PixelFormat fmt, const std::string& device = "-") {
    CameraParams p;
    p.device = device;
    p.width = w;
    p.height = h;
    p.format = fmt;
    return p;
}

} // namespace

TEST_CASE("FdCamera writes whole frames and rejects wrong sizes", "[output]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    {
        FdCamera cam(fds[1], true, params_for(4, 2, PixelFormat::RGBA32, "pipe"));
        REQUIRE(cam.format() == PixelFormat::RGBA32);
        REQUIRE(cam.width() == 4);
        REQUIRE(cam.height() == 2);
        REQUIRE(cam.device() == "pipe");

        std::vector<uint8_t> frame(32);
        for (size_t i = 0; i < frame.size(); ++i) frame[i] = static_cast<uint8_t>(i);
        REQUIRE(cam.send(frame.data(), frame.size()));

        std::vector<uint8_t> rgb_sized(24);
        REQUIRE_FALSE(cam.send(rgb_sized.data(), rgb_sized.size()));
        REQUIRE_FALSE(cam.send(nullptr, 32));

        REQUIRE(cam.stats().frames_sent == 1);
        REQUIRE(cam.stats().bytes_sent == 32);
        REQUIRE(cam.stats().rejected_frames == 2);

        std::vector<uint8_t> back(32);
        REQUIRE(::read(fds[0], back.data(), back.size()) == 32);
        REQUIRE(back == frame);
    }
    // camera owned and closed the write end
    uint8_t b = 0;
    REQUIRE(::read(fds[0], &b, 1) == 0);
    ::close(fds[0]);
}

TEST_CASE("FdCamera reports write failures", "[output]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    ::close(fds[1]);
    // read end only: writing to it fails with EBADF
    FdCamera cam(fds[0], true, params_for(2, 2, PixelFormat::RGB24));
    std::vector<uint8_t> frame(12, 0);
    REQUIRE_FALSE(cam.send(frame.data(), frame.size()));
    REQUIRE(cam.stats().frames_sent == 0);
}

TEST_CASE("create_virtual_camera validates parameters", "[output]") {
    REQUIRE_FALSE(create_virtual_camera(params_for(0, 480, PixelFormat::RGB24)));
    REQUIRE_FALSE(create_virtual_camera(params_for(640, -2, PixelFormat::RGB24)));
    REQUIRE_FALSE(create_virtual_camera(params_for(641, 480, PixelFormat::RGB24)));
    REQUIRE_FALSE(create_virtual_camera(params_for(640, 480, PixelFormat::YUV420P)));
    REQUIRE_FALSE(create_virtual_camera(params_for(640, 480, PixelFormat::BGRA32)));
    REQUIRE_FALSE(create_virtual_camera(params_for(640, 480, PixelFormat::RGB24, "")));
}

TEST_CASE("create_virtual_camera fails for a missing device", "[output]") {
    auto cam = create_virtual_camera(params_for(640, 480, PixelFormat::RGB24, "/nonexistent/video99"));
    REQUIRE_FALSE(cam);
    REQUIRE(cam.error().find("/nonexistent/video99") != std::string::npos);
}

TEST_CASE("Dash selects the raw stdout sink", "[output]") {
    auto cam = create_virtual_camera(params_for(640, 480, PixelFormat::RGBA32));
    REQUIRE(cam);
    REQUIRE((*cam)->format() == PixelFormat::RGBA32);
    REQUIRE((*cam)->device() == "-");
}
