#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dotvid {

/**
 * Counters and timings collected over one pipeline run
 */
struct PipelineStats {
    bool decoding;
    uint32_t threads;

    uint64_t frames;             // frames released in order
    uint64_t original_length;    // file length recorded in the header
    uint64_t input_bytes;        // bytes read from the file or the decoder
    uint64_t output_bytes;       // bytes written to the encoder or the file
    uint64_t frames_discarded;   // trailing frames past the data (decode)
    size_t peak_reorder_depth;   // largest reorder buffer seen

    double setup_ms;             // open input / start the codec
    double transform_ms;         // until the last worker finished
    double total_ms;

    PipelineStats()
        : decoding(false), threads(0),
          frames(0), original_length(0), input_bytes(0), output_bytes(0),
          frames_discarded(0), peak_reorder_depth(0),
          setup_ms(0), transform_ms(0), total_ms(0) {}

    /// Frames per second over the whole run.
    double throughput_fps() const;

    /// Payload megabytes per second over the whole run.
    double throughput_mbps() const;

    // Export to JSON string
    std::string to_json() const;
};

} // namespace dotvid
