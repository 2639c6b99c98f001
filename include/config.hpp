#pragma once

#include <string>
#include <cstdint>
#include <yaml-cpp/yaml.h>
#include "codec_process.hpp"
#include "frame.hpp"

namespace dotvid {

/**
 * @brief Pipeline configuration structure
 *
 * Direction, paths, worker count, frame geometry and the ffmpeg
 * settings. Encode and decode must run with the same geometry.
 */
struct PipelineConfig {
    // Direction and paths
    bool decode = false;
    std::string input_path;
    std::string output_path;

    // Per-frame transform workers
    uint32_t threads = 3;

    // Dot-matrix geometry (shared by encode and decode)
    FrameGeometry geometry;

    // External codec
    CodecSettings codec;

    // Diagnostics
    std::string dump_frames_dir;      // empty = no PNG dumps
    uint32_t dump_frame_limit = 4;    // frames dumped per run
    std::string stats_output;         // empty = no JSON statistics

    /**
     * @brief Load configuration from YAML file
     * @param yaml_path Path to YAML configuration file
     * @param profile_name Optional profile name to load
     * @return true if successful, false otherwise
     */
    bool load_from_yaml(const std::string& yaml_path, const std::string& profile_name = "");

    /**
     * @brief Load configuration from YAML node
     *
     * Keys missing from the node keep their current values.
     * @param node YAML node containing configuration
     * @return true if successful, false otherwise
     */
    bool load_from_node(const YAML::Node& node);

    /**
     * @brief Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;

    /**
     * @brief Print configuration summary to stdout
     */
    void print() const;
};

} // namespace dotvid
