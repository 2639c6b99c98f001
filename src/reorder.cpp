/**
 * @file reorder.cpp
 * @brief Ordered emitter and ordered file writer
 */

#include "reorder.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace dotvid {

// ============================================================================
// ReorderBuffer
// ============================================================================

ReorderBuffer::ReorderBuffer()
    : peak_size_(0)
{
}

void ReorderBuffer::insert(uint64_t index, std::vector<uint8_t>&& payload)
{
    const auto pos = std::lower_bound(keys_.begin(), keys_.end(), index);
    if (pos != keys_.end() && *pos == index) {
        throw IntegrityError("frame " + std::to_string(index) + " delivered twice");
    }

    keys_.insert(pos, index);
    frames_[index] = std::move(payload);
    peak_size_ = std::max(peak_size_, keys_.size());
}

std::vector<uint8_t> ReorderBuffer::pop_front()
{
    const uint64_t index = keys_.front();
    keys_.erase(keys_.begin());

    auto it = frames_.find(index);
    std::vector<uint8_t> payload = std::move(it->second);
    frames_.erase(it);
    return payload;
}

size_t ReorderBuffer::discard_after(uint64_t last)
{
    const auto first_dropped = std::upper_bound(keys_.begin(), keys_.end(), last);
    const size_t dropped = static_cast<size_t>(keys_.end() - first_dropped);
    for (auto it = first_dropped; it != keys_.end(); ++it) {
        frames_.erase(*it);
    }
    keys_.erase(first_dropped, keys_.end());
    return dropped;
}

// ============================================================================
// OrderedEmitter
// ============================================================================

OrderedEmitter::OrderedEmitter(FrameSink& sink)
    : sink_(sink)
    , cursor_(0)
    , offset_(0)
{
}

void OrderedEmitter::accept(Frame&& frame)
{
    if (frame.index < cursor_) {
        throw IntegrityError("frame " + std::to_string(frame.index) + " delivered twice");
    }

    if (frame.index != cursor_) {
        buffer_.insert(frame.index, std::move(frame.payload));
        return;
    }

    emit(frame.payload);
    while (!buffer_.empty() && buffer_.front_index() == cursor_) {
        emit(buffer_.pop_front());
    }
}

void OrderedEmitter::emit(const std::vector<uint8_t>& payload)
{
    sink_.write(payload.data(), payload.size());
    offset_ += payload.size();
    ++cursor_;
}

void OrderedEmitter::finish(uint64_t expected_frames) const
{
    if (cursor_ != expected_frames) {
        throw IntegrityError("frame " + std::to_string(cursor_) + " never arrived ("
                             + std::to_string(cursor_) + " of " + std::to_string(expected_frames)
                             + " frames emitted)");
    }
    if (!buffer_.empty()) {
        throw IntegrityError(std::to_string(buffer_.size())
                             + " frames left in the reorder buffer after the last frame");
    }
}

// ============================================================================
// OrderedFileWriter
// ============================================================================

OrderedFileWriter::OrderedFileWriter(OutputFile& file, size_t capacity)
    : file_(file)
    , capacity_(capacity)
    , header_seen_(false)
    , original_length_(0)
    , last_index_(0)
    , last_frame_bytes_(0)
    , cursor_(1)
    , offset_(0)
    , bytes_written_(0)
    , frames_discarded_(0)
{
}

void OrderedFileWriter::accept(Frame&& frame)
{
    if (!header_seen_) {
        if (frame.index != 0) {
            buffer_.insert(frame.index, std::move(frame.payload));
            return;
        }

        write_header_frame(frame.payload);
        const size_t dropped = buffer_.discard_after(last_index_);
        if (dropped > 0) {
            std::cerr << "Discarding " << dropped << " frames past the end of the data" << std::endl;
            frames_discarded_ += dropped;
        }
        drain();
        return;
    }

    if (frame.index < cursor_) {
        throw IntegrityError("frame " + std::to_string(frame.index) + " delivered twice");
    }

    if (frame.index > last_index_) {
        ++frames_discarded_;
        return;
    }

    if (frame.index != cursor_) {
        buffer_.insert(frame.index, std::move(frame.payload));
        return;
    }

    write_frame(frame.payload);
    drain();
}

void OrderedFileWriter::write_header_frame(const std::vector<uint8_t>& payload)
{
    if (payload.size() != capacity_) {
        throw IntegrityError("frame 0 has " + std::to_string(payload.size())
                             + " bytes, expected " + std::to_string(capacity_));
    }

    original_length_ = decode_length_header(payload.data(), payload.size());
    last_index_ = frame_count_for_length(original_length_, capacity_) - 1;
    last_frame_bytes_ = last_frame_length(original_length_, capacity_);
    header_seen_ = true;

    file_.truncate(original_length_);

    const uint64_t first_bytes = std::min<uint64_t>(original_length_, capacity_ - LENGTH_HEADER_SIZE);
    file_.write_at(payload.data() + LENGTH_HEADER_SIZE, static_cast<size_t>(first_bytes), 0);

    offset_ = capacity_ - LENGTH_HEADER_SIZE;
    bytes_written_ = first_bytes;
    cursor_ = 1;
}

void OrderedFileWriter::write_frame(const std::vector<uint8_t>& payload)
{
    if (payload.size() != capacity_) {
        throw IntegrityError("frame " + std::to_string(cursor_) + " has "
                             + std::to_string(payload.size()) + " bytes, expected "
                             + std::to_string(capacity_));
    }

    const size_t size = (cursor_ == last_index_) ? last_frame_bytes_ : capacity_;
    file_.write_at(payload.data(), size, offset_);

    offset_ += capacity_;
    bytes_written_ += size;
    ++cursor_;
}

void OrderedFileWriter::drain()
{
    while (!buffer_.empty() && buffer_.front_index() == cursor_) {
        write_frame(buffer_.pop_front());
    }
}

void OrderedFileWriter::finish() const
{
    if (!header_seen_) {
        throw IntegrityError("frame 0 never arrived; length header missing");
    }
    if (cursor_ != last_index_ + 1) {
        throw IntegrityError("frame " + std::to_string(cursor_) + " never arrived ("
                             + std::to_string(last_index_ + 1) + " frames expected)");
    }
    if (!buffer_.empty()) {
        throw IntegrityError(std::to_string(buffer_.size())
                             + " frames left in the reorder buffer after the last frame");
    }
    if (bytes_written_ != original_length_) {
        throw IntegrityError("wrote " + std::to_string(bytes_written_) + " of "
                             + std::to_string(original_length_) + " bytes");
    }
}

} // namespace dotvid
