#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "codec_process.hpp"
#include "config.hpp"
#include "frame.hpp"
#include "stats.hpp"

namespace dotvid {

/**
 * @brief Frame pipeline orchestrator
 *
 * Encode: chunk the input file, pack frames on N worker threads, emit
 * them in index order into the encoder.
 *
 * Decode: read raw frames from the decoder on a reader thread, unpack
 * them on N worker threads, write them in index order into the output
 * file.
 *
 * Every failure is fatal. The first error raised on any thread closes
 * all channels, the threads are joined and the error is rethrown from
 * encode()/decode(). Pipeline failures arrive as PipelineError; a failed
 * thread spawn or allocation arrives as the original std::exception.
 */
class FramePipeline {
public:
    /**
     * @brief Construct pipeline with configuration
     * @param config Validated pipeline configuration
     */
    explicit FramePipeline(const PipelineConfig& config);

    /**
     * @brief Encode config.input_path into the sink
     * @throws PipelineError on any I/O, process, integrity or config failure
     * @throws std::exception if worker threads cannot be started
     */
    void encode(FrameSink& sink);

    /**
     * @brief Decode frames from the source into config.output_path
     * @throws PipelineError on any I/O, process, integrity or config failure
     * @throws std::exception if worker threads cannot be started
     */
    void decode(FrameSource& source);

    const PipelineStats& stats() const { return stats_; }

    /**
     * @brief Print run summary statistics
     */
    void print_summary() const;

    /**
     * @brief Write statistics to JSON file
     * @param output_path Path to output JSON file
     * @return true if successful
     */
    bool write_statistics(const std::string& output_path) const;

private:
    PipelineConfig config_;
    PipelineStats stats_;

    /**
     * @brief Dump a frame to PNG if it falls inside the dump window
     */
    void maybe_dump(uint64_t index, const std::vector<uint8_t>& pixels, uint32_t channels) const;
};

} // namespace dotvid
