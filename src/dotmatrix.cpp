/**
 * @file dotmatrix.cpp
 * @brief Frame packer and unpacker
 */

#include "dotmatrix.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace dotvid {

std::vector<uint8_t> pack_frame(
    const uint8_t* payload,
    size_t size,
    const FrameGeometry& geometry)
{
    if (size > geometry.payload_capacity()) {
        throw std::invalid_argument("payload of " + std::to_string(size)
            + " bytes exceeds frame capacity of "
            + std::to_string(geometry.payload_capacity()));
    }

    std::vector<uint8_t> pixels(geometry.pixel_bytes(PACK_CHANNELS), 0);
    if (size == 0) {
        return pixels;
    }

    const uint32_t dot = geometry.dot_size;
    const uint32_t dots_x = geometry.dots_x();
    const uint32_t dots_y = geometry.dots_y();
    const size_t row_stride = static_cast<size_t>(geometry.width) * PACK_CHANNELS;

    size_t current_byte = 0;
    int bit_in_byte = 7;  // MSB first
    bool exhausted = false;

    for (uint32_t dy = 0; dy < dots_y && !exhausted; ++dy) {
        for (uint32_t dx = 0; dx < dots_x && !exhausted; ++dx) {
            uint8_t colour[3] = {0, 0, 0};

            for (int channel = 0; channel < 3; ++channel) {
                if (payload[current_byte] & (1u << bit_in_byte)) {
                    colour[channel] = 0xFF;
                }

                if (bit_in_byte == 0) {
                    ++current_byte;
                    bit_in_byte = 7;
                    if (current_byte == size) {
                        // Partially filled dot is still drawn
                        exhausted = true;
                        break;
                    }
                }
                else {
                    --bit_in_byte;
                }
            }

            if (colour[0] == 0 && colour[1] == 0 && colour[2] == 0) {
                continue;
            }

            const size_t x0 = static_cast<size_t>(dx) * dot;
            const size_t y0 = static_cast<size_t>(dy) * dot;
            for (size_t y = y0; y < y0 + dot; ++y) {
                uint8_t* row = pixels.data() + y * row_stride;
                for (size_t x = x0; x < x0 + dot; ++x) {
                    std::memcpy(row + x * PACK_CHANNELS, colour, 3);
                }
            }
        }
    }

    return pixels;
}

std::vector<uint8_t> unpack_frame(
    const uint8_t* pixels,
    size_t size,
    const FrameGeometry& geometry,
    uint32_t channels)
{
    if (channels < 3) {
        throw std::invalid_argument("unpacking needs at least 3 channels per pixel");
    }
    if (size < geometry.pixel_bytes(channels)) {
        throw std::invalid_argument("bitmap of " + std::to_string(size)
            + " bytes is smaller than one frame ("
            + std::to_string(geometry.pixel_bytes(channels)) + " bytes)");
    }

    const size_t capacity = geometry.payload_capacity();
    std::vector<uint8_t> payload(capacity, 0);

    const uint32_t dot = geometry.dot_size;
    const uint32_t offset = geometry.sample_offset();
    const size_t row_stride = static_cast<size_t>(geometry.width) * channels;

    size_t current_byte = 0;
    int bit_in_byte = 7;

    for (uint32_t y = offset; y < geometry.height && current_byte < capacity; y += dot) {
        const uint8_t* row = pixels + static_cast<size_t>(y) * row_stride;
        for (uint32_t x = offset; x < geometry.width && current_byte < capacity; x += dot) {
            const uint8_t* sample = row + static_cast<size_t>(x) * channels;

            for (int channel = 0; channel < 3 && current_byte < capacity; ++channel) {
                if (sample[channel] & 0x80) {
                    payload[current_byte] |= static_cast<uint8_t>(1u << bit_in_byte);
                }

                if (--bit_in_byte < 0) {
                    ++current_byte;
                    bit_in_byte = 7;
                }
            }
        }
    }

    return payload;
}

void strip_alpha(
    const uint8_t* rgba,
    size_t pixel_count,
    std::vector<uint8_t>& rgb)
{
    rgb.resize(pixel_count * 3);
    for (size_t i = 0; i < pixel_count; ++i) {
        rgb[i * 3 + 0] = rgba[i * 4 + 0];
        rgb[i * 3 + 1] = rgba[i * 4 + 1];
        rgb[i * 3 + 2] = rgba[i * 4 + 2];
    }
}

} // namespace dotvid
