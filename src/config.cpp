/**
 * @file config.cpp
 * @brief Configuration file parsing and management
 *
 * Handles YAML configuration loading with support for multiple profiles
 * and parameter validation.
 */

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <stdexcept>

namespace dotvid {

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

bool PipelineConfig::load_from_yaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        if (!profile_name.empty()) {
            if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
                std::cerr << "Profile not found: " << profile_name << std::endl;
                return false;
            }

            // Root values first, then the profile on top
            if (!load_from_node(config_file)) {
                return false;
            }
            return load_from_node(config_file["profiles"][profile_name]);
        }

        return load_from_node(config_file);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool PipelineConfig::load_from_node(const YAML::Node& node)
{
    try {
        if (node["mode"]) {
            const std::string mode = node["mode"].as<std::string>();
            if (mode == "encode") {
                decode = false;
            }
            else if (mode == "decode") {
                decode = true;
            }
            else {
                std::cerr << "mode must be 'encode' or 'decode', got: " << mode << std::endl;
                return false;
            }
        }

        input_path = get_yaml_value(node, "input", input_path);
        output_path = get_yaml_value(node, "output", output_path);
        threads = get_yaml_value(node, "threads", threads);

        // Geometry
        geometry.width = get_yaml_value(node, "frame_width", geometry.width);
        geometry.height = get_yaml_value(node, "frame_height", geometry.height);
        geometry.dot_size = get_yaml_value(node, "dot_size", geometry.dot_size);

        // Codec block
        if (node["codec"]) {
            const YAML::Node codec_node = node["codec"];
            codec.ffmpeg_path = get_yaml_value(codec_node, "ffmpeg_path", codec.ffmpeg_path);
            codec.video_codec = get_yaml_value(codec_node, "video_codec", codec.video_codec);
            codec.bitrate = get_yaml_value(codec_node, "bitrate", codec.bitrate);
            codec.framerate = get_yaml_value(codec_node, "framerate", codec.framerate);
            codec.gop = get_yaml_value(codec_node, "gop", codec.gop);
            codec.preset = get_yaml_value(codec_node, "preset", codec.preset);
            codec.log_level = get_yaml_value(codec_node, "log_level", codec.log_level);
        }

        // Diagnostics
        dump_frames_dir = get_yaml_value(node, "dump_frames_dir", dump_frames_dir);
        dump_frame_limit = get_yaml_value(node, "dump_frame_limit", dump_frame_limit);
        stats_output = get_yaml_value(node, "stats_output", stats_output);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Invalid configuration value: " << e.what() << std::endl;
        return false;
    }

    return true;
}

bool PipelineConfig::validate() const
{
    if (input_path.empty() || output_path.empty()) {
        std::cerr << "Input and output paths must be specified" << std::endl;
        return false;
    }

    if (threads < 1) {
        std::cerr << "Cannot spawn less than 1 worker thread" << std::endl;
        return false;
    }

    if (geometry.dot_size == 0 || geometry.width % geometry.dot_size != 0
        || geometry.height % geometry.dot_size != 0) {
        std::cerr << "Dot size " << geometry.dot_size << " must divide both "
                  << geometry.width << " and " << geometry.height << std::endl;
        return false;
    }

    if (!geometry.is_valid()) {
        std::cerr << "Frame geometry " << geometry.width << "x" << geometry.height
                  << " with dot size " << geometry.dot_size
                  << " cannot hold the length header" << std::endl;
        return false;
    }

    if (codec.framerate == 0) {
        std::cerr << "Framerate must be > 0" << std::endl;
        return false;
    }

    if (codec.ffmpeg_path.empty()) {
        std::cerr << "ffmpeg path must not be empty" << std::endl;
        return false;
    }

    return true;
}

void PipelineConfig::print() const
{
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Mode: " << (decode ? "decode" : "encode") << std::endl;
    std::cout << "  Input: " << input_path << std::endl;
    std::cout << "  Output: " << output_path << std::endl;
    std::cout << "  Threads: " << threads << std::endl;
    std::cout << "  Frame: " << geometry.width << "x" << geometry.height
              << ", dot size " << geometry.dot_size
              << " (" << geometry.payload_capacity() << " bytes/frame)" << std::endl;
    std::cout << "  Codec: " << codec.video_codec << " @ " << codec.bitrate
              << ", " << codec.framerate << " fps, GOP " << codec.gop << std::endl;
    if (!dump_frames_dir.empty()) {
        std::cout << "  Frame dumps: " << dump_frames_dir
                  << " (first " << dump_frame_limit << ")" << std::endl;
    }
}

} // namespace dotvid
