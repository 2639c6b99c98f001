#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include "codec_process.hpp"
#include "frame.hpp"
#include "output_file.hpp"

namespace dotvid {

/**
 * @file reorder.hpp
 * @brief Reassembly of frames that complete out of order
 *
 * Workers finish frames in arbitrary order. A single owner (one thread)
 * holds the cursor and the reorder buffer and releases frames strictly in
 * ascending, gap-free index order.
 */

/**
 * Frames waiting for a lower index to be released
 *
 * Sorted index list plus index -> payload map. No capacity bound.
 */
class ReorderBuffer {
public:
    ReorderBuffer();

    /**
     * Insert a frame at its sorted position
     * @throws IntegrityError if the index is already buffered
     */
    void insert(uint64_t index, std::vector<uint8_t>&& payload);

    bool empty() const { return keys_.empty(); }
    size_t size() const { return keys_.size(); }

    /// Smallest buffered index; buffer must not be empty.
    uint64_t front_index() const { return keys_.front(); }

    /// Remove and return the smallest buffered frame.
    std::vector<uint8_t> pop_front();

    /**
     * Drop every frame with an index greater than last
     * @return Number of frames dropped
     */
    size_t discard_after(uint64_t last);

    /// Largest number of frames held at once.
    size_t peak_size() const { return peak_size_; }

private:
    std::vector<uint64_t> keys_;
    std::unordered_map<uint64_t, std::vector<uint8_t>> frames_;
    size_t peak_size_;
};

/**
 * Releases packed frames to the encoder in index order (encode direction)
 */
class OrderedEmitter {
public:
    explicit OrderedEmitter(FrameSink& sink);

    /**
     * Emit the frame now, or buffer it until its turn
     * @throws IntegrityError on a frame already emitted or buffered
     */
    void accept(Frame&& frame);

    /**
     * Check that exactly expected_frames frames were emitted
     * @throws IntegrityError naming the first missing index
     */
    void finish(uint64_t expected_frames) const;

    uint64_t cursor() const { return cursor_; }
    uint64_t bytes_emitted() const { return offset_; }
    const ReorderBuffer& buffer() const { return buffer_; }

private:
    void emit(const std::vector<uint8_t>& payload);

    FrameSink& sink_;
    ReorderBuffer buffer_;
    uint64_t cursor_;
    uint64_t offset_;
};

/**
 * Writes unpacked frames to the output file at their byte offsets
 * (decode direction)
 *
 * Frame 0 carries the length header. Until it arrives every frame is
 * buffered; once seen, the file is truncated to the recorded length,
 * the cursor moves to 1 and normal reassembly starts. Frames past the
 * last data-bearing index are discarded.
 */
class OrderedFileWriter {
public:
    /**
     * @param file Open destination file, owned by the caller
     * @param capacity Payload bytes per frame
     */
    OrderedFileWriter(OutputFile& file, size_t capacity);

    /**
     * @throws IntegrityError on duplicate delivery or a short payload
     * @throws IoError if the file cannot be written
     */
    void accept(Frame&& frame);

    /**
     * Check that every data-bearing frame was written
     * @throws IntegrityError if frame 0 or a later frame never arrived
     */
    void finish() const;

    bool header_seen() const { return header_seen_; }
    uint64_t original_length() const { return original_length_; }
    uint64_t last_index() const { return last_index_; }
    uint64_t cursor() const { return cursor_; }
    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t frames_discarded() const { return frames_discarded_; }
    const ReorderBuffer& buffer() const { return buffer_; }

private:
    void write_header_frame(const std::vector<uint8_t>& payload);
    void write_frame(const std::vector<uint8_t>& payload);
    void drain();

    OutputFile& file_;
    size_t capacity_;
    ReorderBuffer buffer_;

    bool header_seen_;
    uint64_t original_length_;
    uint64_t last_index_;
    size_t last_frame_bytes_;   // valid bytes in frame last_index_

    uint64_t cursor_;
    uint64_t offset_;
    uint64_t bytes_written_;
    uint64_t frames_discarded_;
};

} // namespace dotvid
