#include "frame_dump.hpp"
#include "dotmatrix.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace dotvid;

TEST(FrameDump, RgbaFrameReadsBackAsRgb)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> payload = test::random_bytes(g.payload_capacity(), 3);
    const std::vector<uint8_t> rgba = pack_frame(payload, g);

    const std::string path = test::temp_path("frame.png");
    ASSERT_TRUE(write_frame_png(path, rgba, g, PACK_CHANNELS));

    std::vector<uint8_t> rgb;
    uint32_t width = 0;
    uint32_t height = 0;
    ASSERT_TRUE(read_frame_png(path, rgb, width, height));
    EXPECT_EQ(width, g.width);
    EXPECT_EQ(height, g.height);

    std::vector<uint8_t> expected;
    strip_alpha(rgba.data(), rgba.size() / PACK_CHANNELS, expected);
    EXPECT_EQ(rgb, expected);

    // A dumped frame still decodes to its payload
    EXPECT_EQ(unpack_frame(rgb, g), payload);
    std::remove(path.c_str());
}

TEST(FrameDump, RgbFrameIsLossless)
{
    const FrameGeometry g(40, 24, 4);
    const std::vector<uint8_t> rgb = test::random_bytes(g.pixel_bytes(UNPACK_CHANNELS), 8);

    const std::string path = test::temp_path("noise.png");
    ASSERT_TRUE(write_frame_png(path, rgb, g, UNPACK_CHANNELS));

    std::vector<uint8_t> loaded;
    uint32_t width = 0;
    uint32_t height = 0;
    ASSERT_TRUE(read_frame_png(path, loaded, width, height));
    EXPECT_EQ(loaded, rgb);
    std::remove(path.c_str());
}

TEST(FrameDump, RejectsShortBitmap)
{
    const FrameGeometry g(64, 32, 4);
    const std::vector<uint8_t> pixels(g.pixel_bytes(UNPACK_CHANNELS) - 1, 0);
    EXPECT_FALSE(write_frame_png(test::temp_path("short.png"), pixels, g, UNPACK_CHANNELS));
    EXPECT_FALSE(write_frame_png(test::temp_path("gray.png"), pixels, g, 1));
}

TEST(FrameDump, MissingFileIsNotAFrame)
{
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
    EXPECT_FALSE(read_frame_png(test::temp_path("absent.png"), pixels, width, height));
}

TEST(FrameDump, NonPngFileIsNotAFrame)
{
    const std::string path = test::temp_path("text.png");
    const std::string text = "not a png file at all";
    test::write_file(path, std::vector<uint8_t>(text.begin(), text.end()));

    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
    EXPECT_FALSE(read_frame_png(path, pixels, width, height));
    std::remove(path.c_str());
}

TEST(FrameDump, DumpPathIsZeroPadded)
{
    EXPECT_EQ(frame_dump_path("dumps", 0), "dumps/frame_000000.png");
    EXPECT_EQ(frame_dump_path("/tmp/x", 42), "/tmp/x/frame_000042.png");
    EXPECT_EQ(frame_dump_path("d", 1234567), "d/frame_1234567.png");
}

TEST(FrameDump, EnsureDirectory)
{
    const std::string dir = test::temp_path("dumpdir");
    ASSERT_TRUE(ensure_directory(dir));
    EXPECT_TRUE(ensure_directory(dir));

    struct stat st;
    ASSERT_EQ(stat(dir.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    // A regular file in the way
    const std::string file = test::temp_path("plainfile");
    test::write_file(file, std::vector<uint8_t>(1, 0));
    EXPECT_FALSE(ensure_directory(file));

    std::remove(file.c_str());
    rmdir(dir.c_str());
}
