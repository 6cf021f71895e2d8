#include <catch2/catch_test_macros.hpp>
#include "convert/color_convert.hpp"

#include <vector>

using namespace vcam::convert;

namespace {

std::vector<uint8_t> flat_bgra(int w, int h, uint8_t b, uint8_t g, uint8_t r) {
    std::vector<uint8_t> px;
    for (int i = 0; i < w * h; ++i) { px.push_back(b); px.push_back(g); px.push_back(r); px.push_back(255); }
    return px;
}

} // namespace

TEST_CASE("BGRA white and black map to limited-range levels", "[convert][forward]") {
    const int w = 4, h = 2;
    std::vector<uint8_t> yuv(yuv420p_frame_size(w, h), 0xAA);

    auto white = flat_bgra(w, h, 255, 255, 255);
    bgra_to_yuv420p(white.data(), w, h, yuv.data());
    for (int i = 0; i < w * h; ++i) REQUIRE(yuv[i] == 235);
    for (size_t i = static_cast<size_t>(w * h); i < yuv.size(); ++i) REQUIRE(yuv[i] == 128);

    auto black = flat_bgra(w, h, 0, 0, 0);
    bgra_to_yuv420p(black.data(), w, h, yuv.data());
    for (int i = 0; i < w * h; ++i) REQUIRE(yuv[i] == 16);
    for (size_t i = static_cast<size_t>(w * h); i < yuv.size(); ++i) REQUIRE(yuv[i] == 128);
}

TEST_CASE("Chroma comes from the top-left pixel of each block", "[convert][forward]") {
    const int w = 2, h = 2;
    // top-left pure blue, rest white
    auto px = flat_bgra(w, h, 255, 255, 255);
    px[1] = 0; px[2] = 0;
    std::vector<uint8_t> yuv(yuv420p_frame_size(w, h));
    bgra_to_yuv420p(px.data(), w, h, yuv.data());

    // blue: Y = ((25*255+128)>>8)+16 = 41, U = ((112*255+128)>>8)+128 = 240, V = ((-18*255+128)>>8)+128 = 110
    REQUIRE(yuv[0] == 41);
    REQUIRE(yuv[1] == 235);
    REQUIRE(yuv[4] == 240);
    REQUIRE(yuv[5] == 110);
}

TEST_CASE("Grey bars survive a forward and inverse pass", "[convert][forward]") {
    const int w = 4, h = 4;
    auto px = flat_bgra(w, h, 191, 191, 191);
    std::vector<uint8_t> yuv(yuv420p_frame_size(w, h));
    bgra_to_yuv420p(px.data(), w, h, yuv.data());

    VideoFrame f; f.width = w; f.height = h; f.format = PixelFormat::YUV420P; f.data = yuv;
    auto rgb = to_rgb(f, PixelFormat::RGB24);
    REQUIRE(rgb);
    for (uint8_t v : rgb->data) {
        REQUIRE(v >= 189);
        REQUIRE(v <= 193);
    }
}
