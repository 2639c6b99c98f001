#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace dotvid {

/// Size of the big-endian length header that precedes the file bytes.
constexpr size_t LENGTH_HEADER_SIZE = 8;

/// Channels per pixel written to the encoder (RGBA, alpha unused).
constexpr uint32_t PACK_CHANNELS = 4;

/// Channels per pixel read back from the decoder (RGB24).
constexpr uint32_t UNPACK_CHANNELS = 3;

/// Payload bits carried by one macro-dot (one per colour channel).
constexpr uint32_t BITS_PER_DOT = 3;

/**
 * Pixel geometry shared by the packer, the unpacker and the codec process.
 *
 * Encode and decode must agree on it; nothing is negotiated at runtime.
 */
struct FrameGeometry {
    uint32_t width;     // frame width in pixels
    uint32_t height;    // frame height in pixels
    uint32_t dot_size;  // pixels per macro-dot side

    FrameGeometry() : width(1920), height(1080), dot_size(8) {}

    FrameGeometry(uint32_t w, uint32_t h, uint32_t dot)
        : width(w), height(h), dot_size(dot) {}

    uint32_t dots_x() const { return width / dot_size; }
    uint32_t dots_y() const { return height / dot_size; }

    size_t dot_count() const {
        return static_cast<size_t>(dots_x()) * dots_y();
    }

    /// Payload bytes carried by one frame.
    size_t payload_capacity() const {
        return dot_count() * BITS_PER_DOT / 8;
    }

    /// Bytes of one raw video frame with the given channel count.
    size_t pixel_bytes(uint32_t channels) const {
        return static_cast<size_t>(width) * height * channels;
    }

    /// Pixel offset of the sampled pixel inside a macro-dot.
    uint32_t sample_offset() const { return (dot_size - 1) / 2; }

    bool is_valid() const {
        return dot_size > 0 && width > 0 && height > 0
               && width % dot_size == 0 && height % dot_size == 0
               && payload_capacity() > LENGTH_HEADER_SIZE;
    }

    bool operator==(const FrameGeometry& other) const {
        return width == other.width && height == other.height
               && dot_size == other.dot_size;
    }
};

/**
 * One unit of work moving through the pipeline.
 *
 * The payload holds raw bytes or a pixel bitmap depending on the stage;
 * the index never changes once assigned.
 */
struct Frame {
    uint64_t index;
    std::vector<uint8_t> payload;

    Frame() : index(0) {}

    Frame(uint64_t idx, std::vector<uint8_t> data)
        : index(idx), payload(std::move(data)) {}
};

} // namespace dotvid
