#include "config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include <string>

using namespace dotvid;

namespace {

void write_text(const std::string& path, const std::string& text)
{
    test::write_file(path, std::vector<uint8_t>(text.begin(), text.end()));
}

PipelineConfig valid_config()
{
    PipelineConfig config;
    config.input_path = "in.bin";
    config.output_path = "out.mp4";
    return config;
}

const char* kConfigFile =
    "mode: encode\n"
    "input: archive.tar\n"
    "output: archive.mp4\n"
    "threads: 6\n"
    "codec:\n"
    "  video_codec: libx264\n"
    "  bitrate: 20M\n"
    "profiles:\n"
    "  restore:\n"
    "    mode: decode\n"
    "    input: archive.mp4\n"
    "    output: archive.restored.tar\n"
    "  dense:\n"
    "    dot_size: 4\n"
    "    codec:\n"
    "      bitrate: 80M\n";

} // namespace

TEST(PipelineConfig, Defaults)
{
    const PipelineConfig config;
    EXPECT_FALSE(config.decode);
    EXPECT_EQ(config.threads, 3u);
    EXPECT_EQ(config.geometry, FrameGeometry(1920, 1080, 8));
    EXPECT_EQ(config.codec.ffmpeg_path, "ffmpeg");
    EXPECT_EQ(config.codec.bitrate, "30M");
    EXPECT_EQ(config.codec.framerate, 60u);
    EXPECT_EQ(config.codec.gop, 300u);
    EXPECT_TRUE(config.dump_frames_dir.empty());
    EXPECT_TRUE(config.stats_output.empty());
}

TEST(PipelineConfig, LoadsEveryKey)
{
    const YAML::Node node = YAML::Load(
        "mode: decode\n"
        "input: video.mp4\n"
        "output: restored.bin\n"
        "threads: 12\n"
        "frame_width: 1280\n"
        "frame_height: 720\n"
        "dot_size: 4\n"
        "codec:\n"
        "  ffmpeg_path: /opt/ffmpeg/bin/ffmpeg\n"
        "  video_codec: h264_nvenc\n"
        "  bitrate: 50M\n"
        "  framerate: 30\n"
        "  gop: 120\n"
        "  preset: p4\n"
        "  log_level: warning\n"
        "dump_frames_dir: dumps\n"
        "dump_frame_limit: 10\n"
        "stats_output: stats.json\n");

    PipelineConfig config;
    ASSERT_TRUE(config.load_from_node(node));

    EXPECT_TRUE(config.decode);
    EXPECT_EQ(config.input_path, "video.mp4");
    EXPECT_EQ(config.output_path, "restored.bin");
    EXPECT_EQ(config.threads, 12u);
    EXPECT_EQ(config.geometry, FrameGeometry(1280, 720, 4));
    EXPECT_EQ(config.codec.ffmpeg_path, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.codec.video_codec, "h264_nvenc");
    EXPECT_EQ(config.codec.bitrate, "50M");
    EXPECT_EQ(config.codec.framerate, 30u);
    EXPECT_EQ(config.codec.gop, 120u);
    EXPECT_EQ(config.codec.preset, "p4");
    EXPECT_EQ(config.codec.log_level, "warning");
    EXPECT_EQ(config.dump_frames_dir, "dumps");
    EXPECT_EQ(config.dump_frame_limit, 10u);
    EXPECT_EQ(config.stats_output, "stats.json");
    EXPECT_TRUE(config.validate());
}

TEST(PipelineConfig, MissingKeysKeepCurrentValues)
{
    PipelineConfig config = valid_config();
    config.threads = 5;
    ASSERT_TRUE(config.load_from_node(YAML::Load("codec:\n  bitrate: 10M\n")));

    EXPECT_EQ(config.threads, 5u);
    EXPECT_EQ(config.input_path, "in.bin");
    EXPECT_EQ(config.codec.bitrate, "10M");
    EXPECT_EQ(config.codec.video_codec, "libx264");
}

TEST(PipelineConfig, UnknownModeIsRejected)
{
    PipelineConfig config;
    EXPECT_FALSE(config.load_from_node(YAML::Load("mode: transcode\n")));
}

TEST(PipelineConfig, WrongValueTypeIsRejected)
{
    PipelineConfig config;
    EXPECT_FALSE(config.load_from_node(YAML::Load("threads: many\n")));
}

TEST(PipelineConfig, ProfileOverlaysRootValues)
{
    const std::string path = test::temp_path("config.yaml");
    write_text(path, kConfigFile);

    PipelineConfig plain;
    ASSERT_TRUE(plain.load_from_yaml(path));
    EXPECT_FALSE(plain.decode);
    EXPECT_EQ(plain.threads, 6u);
    EXPECT_EQ(plain.codec.bitrate, "20M");

    PipelineConfig restore;
    ASSERT_TRUE(restore.load_from_yaml(path, "restore"));
    EXPECT_TRUE(restore.decode);
    EXPECT_EQ(restore.input_path, "archive.mp4");
    EXPECT_EQ(restore.output_path, "archive.restored.tar");
    EXPECT_EQ(restore.threads, 6u);

    PipelineConfig dense;
    ASSERT_TRUE(dense.load_from_yaml(path, "dense"));
    EXPECT_EQ(dense.geometry.dot_size, 4u);
    EXPECT_EQ(dense.codec.bitrate, "80M");
    EXPECT_EQ(dense.codec.video_codec, "libx264");
    EXPECT_EQ(dense.input_path, "archive.tar");

    std::remove(path.c_str());
}

TEST(PipelineConfig, MissingProfileFails)
{
    const std::string path = test::temp_path("config.yaml");
    write_text(path, kConfigFile);

    PipelineConfig config;
    EXPECT_FALSE(config.load_from_yaml(path, "nonexistent"));
    std::remove(path.c_str());
}

TEST(PipelineConfig, MissingFileFails)
{
    PipelineConfig config;
    EXPECT_FALSE(config.load_from_yaml(test::temp_path("absent.yaml")));
}

TEST(PipelineConfig, ValidateRequiresPaths)
{
    PipelineConfig config;
    EXPECT_FALSE(config.validate());
    EXPECT_TRUE(valid_config().validate());
}

TEST(PipelineConfig, ValidateRejectsZeroThreads)
{
    PipelineConfig config = valid_config();
    config.threads = 0;
    EXPECT_FALSE(config.validate());
}

TEST(PipelineConfig, ValidateRejectsDotSizeThatDoesNotDivide)
{
    PipelineConfig config = valid_config();
    config.geometry.dot_size = 7;
    EXPECT_FALSE(config.validate());

    config.geometry.dot_size = 0;
    EXPECT_FALSE(config.validate());
}

TEST(PipelineConfig, ValidateRejectsFramesTooSmallForTheHeader)
{
    PipelineConfig config = valid_config();
    config.geometry = FrameGeometry(16, 8, 8);
    EXPECT_FALSE(config.validate());
}

TEST(PipelineConfig, ValidateRejectsZeroFramerate)
{
    PipelineConfig config = valid_config();
    config.codec.framerate = 0;
    EXPECT_FALSE(config.validate());
}

TEST(PipelineConfig, ExampleConfigLoads)
{
    PipelineConfig config;
    ASSERT_TRUE(config.load_from_yaml(DOTVID_SOURCE_DIR "/example_config.yaml", "nvenc"));
    EXPECT_EQ(config.codec.video_codec, "h264_nvenc");
    EXPECT_TRUE(config.validate());
}
