#include <gtest/gtest.h>
#include <traitforge/compositor.hpp>
#include <traitforge/errors.hpp>
#include "test_helpers.hpp"

using namespace traitforge;
using namespace test_utils;

TEST(SurfaceTest, CompositeSourceOver) {
    Surface dst(1, 1, {0, 0, 255, 255});
    Surface opaque(1, 1, {255, 0, 0, 255});
    Surface clear(1, 1, {9, 9, 9, 0});
    Surface half(1, 1, {255, 0, 0, 128});

    dst.composite(clear);
    EXPECT_EQ(dst.pixels(), (std::vector<std::uint8_t>{0, 0, 255, 255}));

    dst.composite(half);
    EXPECT_EQ(dst.pixel(0, 0)[3], 255);
    EXPECT_NEAR(dst.pixel(0, 0)[0], 128, 1);
    EXPECT_NEAR(dst.pixel(0, 0)[2], 127, 1);

    dst.composite(opaque);
    EXPECT_EQ(dst.pixels(), opaque.pixels());
    EXPECT_TRUE(dst.is_opaque());

    Surface other(2, 1);
    EXPECT_THROW(dst.composite(other), std::invalid_argument);
    EXPECT_THROW(Surface(2, 2, {1, 2, 3}), std::invalid_argument);
}

TEST(SurfaceTest, ResizeNearestNeighbour) {
    Surface src(2, 1, {1, 1, 1, 255, 2, 2, 2, 255});
    Surface big = src.resized(4, 2);
    EXPECT_EQ(big.width(), 4u);
    EXPECT_EQ(big.pixel(1, 1)[0], 1);
    EXPECT_EQ(big.pixel(2, 0)[0], 2);

    big.reset(4, 2);
    EXPECT_FALSE(big.is_opaque());
    EXPECT_EQ(big.byte_size(), 32u);
}

TEST(ImageFormatTest, SniffSignatures) {
    EXPECT_EQ(sniff_format(png_payload(1, 2, 3)), ImageFormat::Png);
    EXPECT_EQ(sniff_format(jpeg_payload(1, 2, 3)), ImageFormat::Jpeg);
    EXPECT_EQ(sniff_format({'G', 'I', 'F'}), ImageFormat::Unknown);
    EXPECT_EQ(sniff_format({}), ImageFormat::Unknown);
    EXPECT_STREQ(format_extension(ImageFormat::Jpeg), "jpg");
    EXPECT_TRUE(is_lossless(ImageFormat::Png));
}

class CompositorTest : public ::testing::Test {
protected:
    void load(GenerationRequest request, bool with_cache = false) {
        compositor.reset();
        catalog = std::make_unique<Catalog>(std::make_shared<const GenerationRequest>(std::move(request)));
        cache = with_cache ? make_decode_cache(1 << 20) : nullptr;
        compositor = std::make_unique<Compositor>(*catalog, codec, cache.get(), 75);
    }

    static Assignment pick(std::vector<std::int32_t> choice) {
        Assignment a(choice.size());
        a.choice = std::move(choice);
        return a;
    }

    FakeCodec codec;
    std::unique_ptr<Catalog> catalog;
    std::unique_ptr<DecodeCache> cache;
    std::unique_ptr<Compositor> compositor;
};

// Upper layers cover lower ones; attributes follow stacking order
TEST_F(CompositorTest, DrawsInStackingOrder) {
    auto request = two_by_two_request(1);
    // Shape below Background now
    request.layers[1].order = -1;
    load(std::move(request));

    auto result = compositor->render(pick({0, 0}));
    EXPECT_EQ(result.format, ImageFormat::Png);
    ASSERT_EQ(result.attributes.size(), 2u);
    EXPECT_EQ(result.attributes[0], (std::pair<std::string, std::string>{"Shape", "Circle"}));
    EXPECT_EQ(result.attributes[1], (std::pair<std::string, std::string>{"Background", "Red"}));

    // Encoded as signature, width, height, first pixel
    ASSERT_EQ(result.image.size(), 14u);
    EXPECT_EQ(result.image[8], 8);
    EXPECT_EQ(result.image[10], 10);
    EXPECT_EQ(compositor->canvas().pixel(3, 3)[0], 10);
}

TEST_F(CompositorTest, JpegOnlySourcesStayJpeg) {
    auto request = two_by_two_request(1);
    for (auto& layer : request.layers) {
        for (auto& trait : layer.traits) trait.payload = jpeg_payload(5, 5, 5);
    }
    load(std::move(request));

    auto result = compositor->render(pick({1, 1}));
    EXPECT_EQ(result.format, ImageFormat::Jpeg);
    EXPECT_EQ(sniff_format(result.image), ImageFormat::Jpeg);
    EXPECT_EQ(codec.last_quality.load(), 75);
}

// One lossless source forces PNG output
TEST_F(CompositorTest, MixedSourcesUsePng) {
    auto request = two_by_two_request(1);
    request.layers[0].traits[0].payload = jpeg_payload(5, 5, 5);
    load(std::move(request));

    EXPECT_EQ(compositor->render(pick({0, 0})).format, ImageFormat::Png);
}

TEST_F(CompositorTest, YieldsAtEverySuspensionPoint) {
    load(two_by_two_request(1));
    int yields = 0;
    compositor->render(pick({0, 1}), [&yields] { ++yields; });
    EXPECT_EQ(yields, 3);
}

TEST_F(CompositorTest, DecodeCacheReusesSurfaces) {
    load(two_by_two_request(1), true);
    compositor->render(pick({0, 0}));
    compositor->render(pick({0, 1}));
    EXPECT_EQ(codec.decode_calls.load(), 3);
    EXPECT_EQ(cache->size(), 3u);
}

TEST_F(CompositorTest, DecodeFailureNamesTrait) {
    auto request = two_by_two_request(1);
    request.layers[1].traits[1].payload = corrupt_payload();
    request.layers[1].traits[0].payload = out_of_memory_payload();
    load(std::move(request));

    try {
        compositor->render(pick({0, 1}));
        FAIL() << "expected TraitCodecError";
    } catch (const TraitCodecError& e) {
        EXPECT_EQ(e.trait_id(), 4u);
        EXPECT_FALSE(e.transient());
        EXPECT_EQ(e.code(), ErrorCode::Codec);
    }

    try {
        compositor->render(pick({0, 0}));
        FAIL() << "expected TraitCodecError";
    } catch (const TraitCodecError& e) {
        EXPECT_EQ(e.trait_id(), 3u);
        EXPECT_TRUE(e.transient());
    }
}

// Every layer skipped still gives a transparent PNG
TEST_F(CompositorTest, EmptySelection) {
    auto request = base_request(1);
    request.layers.push_back(make_layer(1, "Hat", 0, {make_trait(1, "Cap")}, true));
    load(std::move(request));

    auto result = compositor->render(pick({Assignment::SKIPPED}));
    EXPECT_EQ(result.format, ImageFormat::Png);
    EXPECT_TRUE(result.attributes.empty());
    EXPECT_EQ(result.image[13], 0);
}

TEST_F(CompositorTest, PreviewIsThumbnail) {
    load(two_by_two_request(1));
    compositor->render(pick({1, 0}));
    auto thumb = compositor->preview(Compositor::PREVIEW_SIZE);
    EXPECT_EQ(sniff_format(thumb), ImageFormat::Png);
    EXPECT_EQ(thumb[8], Compositor::PREVIEW_SIZE);
    EXPECT_EQ(thumb[10], 30);
}
