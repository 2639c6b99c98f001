/**
 * @file chunker.cpp
 * @brief Length header bookkeeping and input segmentation
 */

#include "chunker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

namespace dotvid {

LengthHeader encode_length_header(uint64_t length)
{
    LengthHeader header;
    for (size_t i = 0; i < LENGTH_HEADER_SIZE; ++i) {
        header[i] = static_cast<uint8_t>(length >> (8 * (LENGTH_HEADER_SIZE - 1 - i)));
    }
    return header;
}

uint64_t decode_length_header(const uint8_t* data, size_t size)
{
    if (size < LENGTH_HEADER_SIZE) {
        throw IntegrityError("frame 0 is too short to hold the length header");
    }

    uint64_t length = 0;
    for (size_t i = 0; i < LENGTH_HEADER_SIZE; ++i) {
        length = (length << 8) | data[i];
    }
    return length;
}

uint64_t frame_count_for_length(uint64_t length, size_t capacity)
{
    const uint64_t total = length + LENGTH_HEADER_SIZE;
    return (total + capacity - 1) / capacity;
}

size_t last_frame_length(uint64_t length, size_t capacity)
{
    const uint64_t total = length + LENGTH_HEADER_SIZE;
    const uint64_t full_frames = frame_count_for_length(length, capacity) - 1;
    return static_cast<size_t>(total - full_frames * capacity);
}

Chunker::Chunker(std::istream& input, uint64_t length, size_t capacity)
    : input_(input)
    , length_(length)
    , remaining_(length)
    , capacity_(capacity)
    , frame_count_(frame_count_for_length(length, capacity))
    , next_index_(0)
{
}

bool Chunker::next(Frame& frame)
{
    if (next_index_ >= frame_count_) {
        return false;
    }

    size_t offset = 0;
    size_t room = capacity_;
    if (next_index_ == 0) {
        room -= LENGTH_HEADER_SIZE;
        offset = LENGTH_HEADER_SIZE;
    }

    const size_t take = static_cast<size_t>(std::min<uint64_t>(room, remaining_));

    frame.index = next_index_;
    frame.payload.resize(offset + take);

    if (next_index_ == 0) {
        const LengthHeader header = encode_length_header(length_);
        std::copy(header.begin(), header.end(), frame.payload.begin());
    }

    if (take > 0) {
        input_.read(reinterpret_cast<char*>(frame.payload.data() + offset),
                    static_cast<std::streamsize>(take));
        if (static_cast<size_t>(input_.gcount()) != take) {
            throw IoError("input ended after " + std::to_string(length_ - remaining_ + input_.gcount())
                          + " of " + std::to_string(length_) + " bytes");
        }
    }

    remaining_ -= take;
    ++next_index_;
    return true;
}

} // namespace dotvid
