#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "frame.hpp"

namespace dotvid {

/**
 * @file dotmatrix.hpp
 * @brief Bit-level transform between payload bytes and dot-matrix bitmaps
 *
 * Each macro-dot is a dot_size x dot_size block of one solid colour whose
 * R, G and B channels carry one payload bit each (0xFF for 1, 0x00 for 0).
 * Bits are read MSB first and dots are laid out row-major.
 *
 * Decoding samples a single pixel inside every macro-dot and tests only
 * the high bit of each channel, which absorbs moderate codec noise.
 */

/**
 * Pack a payload segment into an RGBA bitmap
 * @param payload Segment bytes
 * @param size Segment length, at most geometry.payload_capacity()
 * @param geometry Frame geometry
 * @return width * height * 4 bytes; dots past the payload stay black
 * @throws std::invalid_argument if the payload exceeds the frame capacity
 */
std::vector<uint8_t> pack_frame(
    const uint8_t* payload,
    size_t size,
    const FrameGeometry& geometry);

inline std::vector<uint8_t> pack_frame(
    const std::vector<uint8_t>& payload,
    const FrameGeometry& geometry)
{
    return pack_frame(payload.data(), payload.size(), geometry);
}

/**
 * Recover the payload from a decoded bitmap
 * @param pixels Interleaved pixel data, channels bytes per pixel
 * @param size Length of pixels, at least geometry.pixel_bytes(channels)
 * @param geometry Frame geometry used when packing
 * @param channels Bytes per pixel (3 for RGB24, 4 for RGBA)
 * @return Exactly geometry.payload_capacity() bytes
 * @throws std::invalid_argument on a short buffer or fewer than 3 channels
 */
std::vector<uint8_t> unpack_frame(
    const uint8_t* pixels,
    size_t size,
    const FrameGeometry& geometry,
    uint32_t channels = UNPACK_CHANNELS);

inline std::vector<uint8_t> unpack_frame(
    const std::vector<uint8_t>& pixels,
    const FrameGeometry& geometry,
    uint32_t channels = UNPACK_CHANNELS)
{
    return unpack_frame(pixels.data(), pixels.size(), geometry, channels);
}

/**
 * Drop the alpha byte of every pixel (RGBA -> RGB24)
 */
void strip_alpha(
    const uint8_t* rgba,
    size_t pixel_count,
    std::vector<uint8_t>& rgb);

} // namespace dotvid
