#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include "frame.hpp"

namespace dotvid {

/**
 * @file chunker.hpp
 * @brief Length header and fixed-size segmentation of the payload stream
 *
 * The logical stream is an 8-byte big-endian length followed by the file
 * bytes. It is cut into segments of exactly one frame's payload capacity;
 * only the last segment may be shorter.
 */

using LengthHeader = std::array<uint8_t, LENGTH_HEADER_SIZE>;

LengthHeader encode_length_header(uint64_t length);

/**
 * Read the length header from the start of a frame payload
 * @param data At least LENGTH_HEADER_SIZE bytes
 * @param size Bytes available at data
 * @throws IntegrityError if fewer than LENGTH_HEADER_SIZE bytes are available
 */
uint64_t decode_length_header(const uint8_t* data, size_t size);

/**
 * Number of frames needed for a file of the given length
 *
 * ceil((length + header) / capacity); never zero since the header alone
 * occupies frame 0.
 */
uint64_t frame_count_for_length(uint64_t length, size_t capacity);

/**
 * Valid bytes in the last data-bearing frame, in [1, capacity]
 */
size_t last_frame_length(uint64_t length, size_t capacity);

/**
 * Splits a length-prefixed input stream into frame-sized segments
 */
class Chunker {
public:
    /**
     * @param input Stream positioned at the first file byte
     * @param length Number of file bytes that will be read from input
     * @param capacity Payload bytes per frame
     */
    Chunker(std::istream& input, uint64_t length, size_t capacity);

    /**
     * Produce the next segment
     * @param frame Receives the segment and its index
     * @return false once every segment has been produced
     * @throws IoError if the stream ends early or fails
     */
    bool next(Frame& frame);

    uint64_t frame_count() const { return frame_count_; }
    uint64_t frames_produced() const { return next_index_; }

private:
    std::istream& input_;
    uint64_t length_;
    uint64_t remaining_;
    size_t capacity_;
    uint64_t frame_count_;
    uint64_t next_index_;
};

} // namespace dotvid
