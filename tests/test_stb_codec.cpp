#include <gtest/gtest.h>
#include <traitforge/errors.hpp>
#include <traitforge/stb_codec.hpp>

using namespace traitforge;

class StbCodecTest : public ::testing::Test {
protected:
    static Surface solid(std::uint32_t w, std::uint32_t h, std::uint8_t r, std::uint8_t g,
                         std::uint8_t b, std::uint8_t a) {
        Surface s(w, h);
        for (std::uint32_t y = 0; y < h; ++y) {
            for (std::uint32_t x = 0; x < w; ++x) {
                std::uint8_t* p = s.pixel(x, y);
                p[0] = r;
                p[1] = g;
                p[2] = b;
                p[3] = a;
            }
        }
        return s;
    }

    StbImageCodec codec;
};

// PNG is lossless, alpha included
TEST_F(StbCodecTest, PngRoundTrip) {
    auto bytes = codec.encode(solid(4, 3, 10, 20, 30, 128), ImageFormat::Png, 90);
    EXPECT_EQ(sniff_format(bytes), ImageFormat::Png);

    Surface decoded = codec.decode(bytes, 4, 3);
    EXPECT_EQ(decoded.width(), 4u);
    EXPECT_EQ(decoded.height(), 3u);
    const std::uint8_t* p = decoded.pixel(2, 1);
    EXPECT_EQ(p[0], 10);
    EXPECT_EQ(p[1], 20);
    EXPECT_EQ(p[2], 30);
    EXPECT_EQ(p[3], 128);
}

TEST_F(StbCodecTest, DecodeResizesToTarget) {
    auto bytes = codec.encode(solid(2, 2, 200, 0, 0, 255), ImageFormat::Png, 90);
    Surface decoded = codec.decode(bytes, 8, 6);
    EXPECT_EQ(decoded.width(), 8u);
    EXPECT_EQ(decoded.height(), 6u);
    EXPECT_EQ(decoded.pixel(7, 5)[0], 200);
}

// Larger payloads are sampled down, keeping each region's colour
TEST_F(StbCodecTest, DecodeDownsamplesToTarget) {
    Surface split = solid(4, 4, 255, 0, 0, 255);
    for (std::uint32_t y = 0; y < 4; ++y) {
        for (std::uint32_t x = 2; x < 4; ++x) {
            split.pixel(x, y)[0] = 0;
            split.pixel(x, y)[2] = 255;
        }
    }
    auto bytes = codec.encode(split, ImageFormat::Png, 90);

    Surface decoded = codec.decode(bytes, 2, 2);
    EXPECT_EQ(decoded.width(), 2u);
    EXPECT_EQ(decoded.height(), 2u);
    EXPECT_EQ(decoded.byte_size(), 2u * 2u * Surface::CHANNELS);
    EXPECT_EQ(decoded.pixel(0, 1)[0], 255);
    EXPECT_EQ(decoded.pixel(0, 1)[2], 0);
    EXPECT_EQ(decoded.pixel(1, 0)[0], 0);
    EXPECT_EQ(decoded.pixel(1, 0)[2], 255);
    EXPECT_EQ(decoded.pixel(1, 1)[3], 255);
}

TEST_F(StbCodecTest, JpegIsOpaqueAndClose) {
    auto bytes = codec.encode(solid(16, 16, 0, 0, 255, 255), ImageFormat::Jpeg, 95);
    EXPECT_EQ(sniff_format(bytes), ImageFormat::Jpeg);

    Surface decoded = codec.decode(bytes, 16, 16);
    EXPECT_TRUE(decoded.is_opaque());
    EXPECT_NEAR(decoded.pixel(8, 8)[2], 255, 8);
    EXPECT_NEAR(decoded.pixel(8, 8)[0], 0, 8);
}

TEST_F(StbCodecTest, GarbageIsPermanentFailure) {
    std::vector<std::uint8_t> garbage = {0x89, 'P', 'N', 'G', 1, 2, 3};
    try {
        codec.decode(garbage, 4, 4);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_FALSE(e.transient());
    }
    EXPECT_THROW(codec.decode({}, 4, 4), CodecError);
    EXPECT_THROW(codec.encode(Surface(), ImageFormat::Png, 90), CodecError);
}
