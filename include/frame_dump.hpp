#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "frame.hpp"

namespace dotvid {

/**
 * @file frame_dump.hpp
 * @brief PNG snapshots of pipeline frames for inspecting codec noise
 */

/**
 * Write one frame as an 8-bit RGB PNG
 * @param path Output PNG path
 * @param pixels Interleaved pixels, channels bytes each (3 or 4)
 * @param geometry Frame geometry
 * @param channels 3 for RGB24, 4 for RGBA (alpha is dropped)
 * @return true on success
 */
bool write_frame_png(
    const std::string& path,
    const std::vector<uint8_t>& pixels,
    const FrameGeometry& geometry,
    uint32_t channels);

/**
 * Load an 8-bit RGB or RGBA PNG as RGB24
 * @param path PNG path
 * @param pixels Receives width * height * 3 bytes
 * @param width Image width (output)
 * @param height Image height (output)
 * @return true on success
 */
bool read_frame_png(
    const std::string& path,
    std::vector<uint8_t>& pixels,
    uint32_t& width,
    uint32_t& height);

/**
 * Dump file name for a frame, e.g. <dir>/frame_000042.png
 */
std::string frame_dump_path(const std::string& dir, uint64_t index);

/**
 * Create the dump directory if needed
 */
bool ensure_directory(const std::string& dir);

} // namespace dotvid
