/**
 * @file main.cpp
 * @brief Command-line interface for the dotvid file-to-video tool
 *
 * Encodes any file as a sequence of dot-matrix frames piped through
 * ffmpeg, and decodes such a video back into the original bytes.
 *
 * Usage:
 *   dotvid -i archive.tar -o archive.mp4
 *   dotvid -d -i archive.mp4 -o archive.tar
 *   dotvid --config example_config.yaml --profile nvenc
 */

#include "chunker.hpp"
#include "codec_process.hpp"
#include "config.hpp"
#include "dotmatrix.hpp"
#include "errors.hpp"
#include "frame_dump.hpp"
#include "pipeline.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <csignal>
#include <sys/stat.h>

namespace {

void print_usage(const char* program_name)
{
    std::cout << "dotvid - store files as dot-matrix video" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " -i <file> -o <video> [options]" << std::endl;
    std::cout << "  " << program_name << " -d -i <video> -o <file> [options]" << std::endl;
    std::cout << "  " << program_name << " --config <yaml_file> [--profile <name>]" << std::endl;
    std::cout << "  " << program_name << " --inspect <frame.png> [geometry options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -i, --input <path>     Input file (encode) or video (decode)" << std::endl;
    std::cout << "  -o, --output <path>    Output video (encode) or file (decode)" << std::endl;
    std::cout << "  -d, --decode           Decode a video instead of encoding a file" << std::endl;
    std::cout << "  -t, --threads <N>      Number of worker threads (default 3)" << std::endl;
    std::cout << "  --config <path>        Load configuration from YAML file" << std::endl;
    std::cout << "  --profile <name>       Use specific profile from config file" << std::endl;
    std::cout << "  --width <px>           Frame width (default 1920)" << std::endl;
    std::cout << "  --height <px>          Frame height (default 1080)" << std::endl;
    std::cout << "  --dot-size <px>        Macro-dot size; must divide width and height (default 8)" << std::endl;
    std::cout << "  --codec <name>         ffmpeg video codec (default libx264)" << std::endl;
    std::cout << "  --bitrate <rate>       Encoder bitrate (default 30M)" << std::endl;
    std::cout << "  --ffmpeg <path>        ffmpeg executable (default ffmpeg)" << std::endl;
    std::cout << "  --dump-frames <dir>    Write the first frames as PNG" << std::endl;
    std::cout << "  --dump-limit <N>       Number of frames to dump (default 4)" << std::endl;
    std::cout << "  --stats <path>         Write run statistics as JSON" << std::endl;
    std::cout << "  --loopback             Encode and decode in memory, without ffmpeg" << std::endl;
    std::cout << "  --inspect <png>        Unpack one dumped frame and print its header" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
    std::cout << std::endl;
}

struct CommandLine {
    std::string config_file;
    std::string profile;
    std::string inspect_path;
    bool loopback = false;
};

// Flags are applied after the YAML file so they override it
bool parse_command_line(int argc, char** argv, dotvid::PipelineConfig& config, CommandLine& cli,
                        bool apply_overrides)
{
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto number = [&](uint32_t& out) {
            std::string text;
            if (!value(text)) {
                return false;
            }
            try {
                const unsigned long parsed = std::stoul(text);
                if (text[0] == '-' || parsed > 0xFFFFFFFFul) {
                    throw std::out_of_range(text);
                }
                out = static_cast<uint32_t>(parsed);
            }
            catch (const std::exception&) {
                std::cerr << "Error: " << arg << " expects a non-negative integer, got: " << text << std::endl;
                return false;
            }
            return true;
        };

        std::string text;
        uint32_t n = 0;

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config") {
            if (!value(cli.config_file)) return false;
        }
        else if (arg == "--profile") {
            if (!value(cli.profile)) return false;
        }
        else if (arg == "--inspect") {
            if (!value(cli.inspect_path)) return false;
        }
        else if (arg == "--loopback") {
            cli.loopback = true;
        }
        else if (arg == "-d" || arg == "--decode") {
            if (apply_overrides) config.decode = true;
        }
        else if (arg == "-i" || arg == "--input") {
            if (!value(text)) return false;
            if (apply_overrides) config.input_path = text;
        }
        else if (arg == "-o" || arg == "--output") {
            if (!value(text)) return false;
            if (apply_overrides) config.output_path = text;
        }
        else if (arg == "-t" || arg == "--threads") {
            if (!number(n)) return false;
            if (apply_overrides) config.threads = n;
        }
        else if (arg == "--width") {
            if (!number(n)) return false;
            if (apply_overrides) config.geometry.width = n;
        }
        else if (arg == "--height") {
            if (!number(n)) return false;
            if (apply_overrides) config.geometry.height = n;
        }
        else if (arg == "--dot-size") {
            if (!number(n)) return false;
            if (apply_overrides) config.geometry.dot_size = n;
        }
        else if (arg == "--codec") {
            if (!value(text)) return false;
            if (apply_overrides) config.codec.video_codec = text;
        }
        else if (arg == "--bitrate") {
            if (!value(text)) return false;
            if (apply_overrides) config.codec.bitrate = text;
        }
        else if (arg == "--ffmpeg") {
            if (!value(text)) return false;
            if (apply_overrides) config.codec.ffmpeg_path = text;
        }
        else if (arg == "--dump-frames") {
            if (!value(text)) return false;
            if (apply_overrides) config.dump_frames_dir = text;
        }
        else if (arg == "--dump-limit") {
            if (!number(n)) return false;
            if (apply_overrides) config.dump_frame_limit = n;
        }
        else if (arg == "--stats") {
            if (!value(text)) return false;
            if (apply_overrides) config.stats_output = text;
        }
        else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    return true;
}

bool file_exists(const std::string& path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

int inspect_frame(const std::string& png_path, const dotvid::FrameGeometry& geometry)
{
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
    if (!dotvid::read_frame_png(png_path, pixels, width, height)) {
        return 1;
    }

    const dotvid::FrameGeometry frame_geometry(width, height, geometry.dot_size);
    if (!frame_geometry.is_valid()) {
        std::cerr << "Frame " << width << "x" << height << " does not fit dot size "
                  << geometry.dot_size << std::endl;
        return 1;
    }

    const std::vector<uint8_t> payload = dotvid::unpack_frame(pixels, frame_geometry);
    const uint64_t length = dotvid::decode_length_header(payload.data(), payload.size());
    const size_t capacity = frame_geometry.payload_capacity();

    std::cout << "Frame: " << width << "x" << height << ", dot size " << frame_geometry.dot_size << std::endl;
    std::cout << "Capacity: " << capacity << " bytes/frame" << std::endl;
    std::cout << "If this is frame 0:" << std::endl;
    std::cout << "  Recorded length: " << length << " bytes" << std::endl;
    std::cout << "  Frames: " << dotvid::frame_count_for_length(length, capacity) << std::endl;
    std::cout << "  Valid bytes in last frame: " << dotvid::last_frame_length(length, capacity) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    // A dead encoder must surface as a write error, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    dotvid::PipelineConfig config;
    CommandLine cli;

    if (!parse_command_line(argc, argv, config, cli, false)) {
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration
    if (!cli.config_file.empty()) {
        std::cout << "Loading configuration from: " << cli.config_file << std::endl;
        if (!cli.profile.empty()) {
            std::cout << "Using profile: " << cli.profile << std::endl;
        }

        if (!config.load_from_yaml(cli.config_file, cli.profile)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    if (!parse_command_line(argc, argv, config, cli, true)) {
        print_usage(argv[0]);
        return 1;
    }

    if (!cli.inspect_path.empty()) {
        try {
            return inspect_frame(cli.inspect_path, config.geometry);
        }
        catch (const std::exception& e) {
            std::cerr << "Inspection failed: " << e.what() << std::endl;
            return 1;
        }
    }

    // Validate configuration
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (!file_exists(config.input_path)) {
        std::cerr << "File " << config.input_path << " does not exist." << std::endl;
        return 1;
    }

    std::cout << std::endl;
    config.print();
    std::cout << std::endl;

    dotvid::FramePipeline pipeline(config);

    try {
        if (cli.loopback) {
            // Encode into memory, then decode what the codec would return
            dotvid::PipelineConfig encode_config = config;
            encode_config.decode = false;
            dotvid::FramePipeline encoder(encode_config);
            dotvid::MemoryFrameSink sink(config.geometry);
            encoder.encode(sink);
            encoder.print_summary();

            dotvid::PipelineConfig decode_config = config;
            decode_config.decode = true;
            decode_config.dump_frames_dir.clear();
            pipeline = dotvid::FramePipeline(decode_config);
            dotvid::MemoryFrameSource source(config.geometry, sink.to_rgb24());
            pipeline.decode(source);
        }
        else if (config.decode) {
            dotvid::FfmpegDecoderSource source(config.codec, config.geometry, config.input_path);
            pipeline.decode(source);
        }
        else {
            dotvid::FfmpegEncoderSink sink(config.codec, config.geometry, config.output_path);
            pipeline.encode(sink);
        }
    }
    catch (const dotvid::PipelineError& e) {
        std::cerr << "Fatal " << dotvid::error_kind_name(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Exception in pipeline: " << e.what() << std::endl;
        return 1;
    }

    pipeline.print_summary();

    if (!config.stats_output.empty() && !pipeline.write_statistics(config.stats_output)) {
        return 1;
    }

    std::cout << std::endl;
    if (cli.loopback) {
        std::cout << "Loopback round trip completed successfully" << std::endl;
    }
    else if (config.decode) {
        std::cout << "Video decoded successfully" << std::endl;
    }
    else {
        std::cout << "Video exported successfully" << std::endl;
    }

    return 0;
}
