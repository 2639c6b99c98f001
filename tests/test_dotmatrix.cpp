#include "dotmatrix.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace dotvid;

namespace {

// Pixel (x, y) of an interleaved bitmap
const uint8_t* pixel_at(const std::vector<uint8_t>& pixels, const FrameGeometry& g,
                        uint32_t channels, uint32_t x, uint32_t y)
{
    return pixels.data() + (static_cast<size_t>(y) * g.width + x) * channels;
}

void expect_dot_colour(const std::vector<uint8_t>& rgba, const FrameGeometry& g,
                       uint32_t dot_x, uint32_t dot_y, uint8_t r, uint8_t gr, uint8_t b)
{
    for (uint32_t y = dot_y * g.dot_size; y < (dot_y + 1) * g.dot_size; ++y) {
        for (uint32_t x = dot_x * g.dot_size; x < (dot_x + 1) * g.dot_size; ++x) {
            const uint8_t* p = pixel_at(rgba, g, PACK_CHANNELS, x, y);
            ASSERT_EQ(p[0], r) << "at " << x << "," << y;
            ASSERT_EQ(p[1], gr) << "at " << x << "," << y;
            ASSERT_EQ(p[2], b) << "at " << x << "," << y;
            ASSERT_EQ(p[3], 0) << "alpha at " << x << "," << y;
        }
    }
}

std::vector<uint8_t> to_rgb(const std::vector<uint8_t>& rgba)
{
    std::vector<uint8_t> rgb;
    strip_alpha(rgba.data(), rgba.size() / PACK_CHANNELS, rgb);
    return rgb;
}

} // namespace

TEST(FrameGeometry, DefaultCapacity)
{
    const FrameGeometry g;
    EXPECT_EQ(g.dots_x(), 240u);
    EXPECT_EQ(g.dots_y(), 135u);
    EXPECT_EQ(g.payload_capacity(), 12150u);
    EXPECT_EQ(g.pixel_bytes(UNPACK_CHANNELS), 1920u * 1080u * 3u);
    EXPECT_EQ(g.sample_offset(), 3u);
    EXPECT_TRUE(g.is_valid());
}

TEST(FrameGeometry, RejectsDotSizeThatDoesNotDivide)
{
    EXPECT_FALSE(FrameGeometry(1920, 1080, 7).is_valid());
    EXPECT_FALSE(FrameGeometry(64, 32, 0).is_valid());
    // 2 dots carry less than the length header
    EXPECT_FALSE(FrameGeometry(16, 8, 8).is_valid());
}

TEST(PackFrame, BitsFillChannelsMsbFirst)
{
    const FrameGeometry g(64, 32, 4);
    // 1011 0011: dots (1,0,1) (1,0,0) and a partial (1,1,-)
    const std::vector<uint8_t> payload = {0xB3};

    const std::vector<uint8_t> rgba = pack_frame(payload, g);
    ASSERT_EQ(rgba.size(), g.pixel_bytes(PACK_CHANNELS));

    expect_dot_colour(rgba, g, 0, 0, 0xFF, 0x00, 0xFF);
    expect_dot_colour(rgba, g, 1, 0, 0xFF, 0x00, 0x00);
    expect_dot_colour(rgba, g, 2, 0, 0xFF, 0xFF, 0x00);
    expect_dot_colour(rgba, g, 3, 0, 0x00, 0x00, 0x00);
    expect_dot_colour(rgba, g, 0, 1, 0x00, 0x00, 0x00);
}

TEST(PackFrame, DotsAreRowMajor)
{
    const FrameGeometry g(64, 32, 4);  // 16 x 8 dots
    std::vector<uint8_t> payload(g.payload_capacity(), 0);
    // Dot 16 (first dot of the second row) starts at bit 48 = byte 6
    payload[6] = 0xE0;

    const std::vector<uint8_t> rgba = pack_frame(payload, g);
    expect_dot_colour(rgba, g, 0, 1, 0xFF, 0xFF, 0xFF);
    expect_dot_colour(rgba, g, 15, 0, 0x00, 0x00, 0x00);
    expect_dot_colour(rgba, g, 1, 1, 0x00, 0x00, 0x00);
}

TEST(PackFrame, EmptyPayloadIsBlack)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> rgba = pack_frame(std::vector<uint8_t>(), g);
    EXPECT_EQ(rgba, std::vector<uint8_t>(g.pixel_bytes(PACK_CHANNELS), 0));
}

TEST(PackFrame, IsDeterministic)
{
    const FrameGeometry g(96, 48, 8);
    const std::vector<uint8_t> payload = test::random_bytes(g.payload_capacity(), 11);
    EXPECT_EQ(pack_frame(payload, g), pack_frame(payload, g));
}

TEST(PackFrame, OversizedPayloadIsRejected)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> payload(g.payload_capacity() + 1, 0xFF);
    EXPECT_THROW(pack_frame(payload, g), std::invalid_argument);
}

TEST(UnpackFrame, RecoversFullPayloadAcrossGeometries)
{
    const FrameGeometry geometries[] = {
        FrameGeometry(64, 32, 4),
        FrameGeometry(96, 48, 8),
        FrameGeometry(16, 16, 1),
        FrameGeometry(40, 24, 4),   // 180 bits: last 4 bits unused
        FrameGeometry(30, 18, 3),
    };

    uint32_t seed = 1;
    for (const FrameGeometry& g : geometries) {
        ASSERT_TRUE(g.is_valid());
        const std::vector<uint8_t> payload = test::random_bytes(g.payload_capacity(), seed++);
        const std::vector<uint8_t> rgb = to_rgb(pack_frame(payload, g));

        EXPECT_EQ(unpack_frame(rgb, g), payload)
            << g.width << "x" << g.height << " dot " << g.dot_size;
    }
}

TEST(UnpackFrame, ShortPayloadComesBackZeroPadded)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> payload = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x41};

    const std::vector<uint8_t> unpacked = unpack_frame(to_rgb(pack_frame(payload, g)), g);
    ASSERT_EQ(unpacked.size(), g.payload_capacity());
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), unpacked.begin()));
    for (size_t i = payload.size(); i < unpacked.size(); ++i) {
        EXPECT_EQ(unpacked[i], 0) << "byte " << i;
    }
}

TEST(UnpackFrame, AcceptsRgbaInput)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> payload = test::random_bytes(g.payload_capacity(), 5);
    EXPECT_EQ(unpack_frame(pack_frame(payload, g), g, PACK_CHANNELS), payload);
}

TEST(UnpackFrame, ToleratesNoiseBelowThreshold)
{
    const FrameGeometry g(96, 48, 8);
    const std::vector<uint8_t> payload = test::random_bytes(g.payload_capacity(), 9);
    std::vector<uint8_t> rgb = to_rgb(pack_frame(payload, g));

    for (auto& value : rgb) {
        value = (value == 0xFF) ? 0xE0 : 0x10;
    }

    EXPECT_EQ(unpack_frame(rgb, g), payload);
}

TEST(UnpackFrame, SamplesOnlyOnePixelPerDot)
{
    const FrameGeometry g(64, 32, 4);
    std::vector<uint8_t> payload(g.payload_capacity(), 0);
    payload[0] = 0xE0;  // dot 0 white
    std::vector<uint8_t> rgb = to_rgb(pack_frame(payload, g));

    // Corner pixel of dot 0 goes black; the sampled pixel is (1, 1)
    rgb[0] = rgb[1] = rgb[2] = 0;
    EXPECT_EQ(unpack_frame(rgb, g), payload);

    // Darkening the sampled pixel past the threshold flips the bits
    const size_t sample = (static_cast<size_t>(g.sample_offset()) * g.width + g.sample_offset()) * 3;
    rgb[sample] = 0x7F;
    const std::vector<uint8_t> flipped = unpack_frame(rgb, g);
    EXPECT_EQ(flipped[0], 0x60);
}

TEST(UnpackFrame, ShortBitmapIsRejected)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> rgb(g.pixel_bytes(UNPACK_CHANNELS) - 1, 0);
    EXPECT_THROW(unpack_frame(rgb, g), std::invalid_argument);
}

TEST(StripAlpha, DropsEveryFourthByte)
{
    const std::vector<uint8_t> rgba = {1, 2, 3, 4, 5, 6, 7, 8};
    std::vector<uint8_t> rgb;
    strip_alpha(rgba.data(), 2, rgb);
    const std::vector<uint8_t> expected = {1, 2, 3, 5, 6, 7};
    EXPECT_EQ(rgb, expected);
}
