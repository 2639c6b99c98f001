/**
 * @file pipeline.cpp
 * @brief Frame pipeline orchestration
 *
 * Thread layout (both directions):
 * - one producer: the chunker (encode, calling thread) or the decoder
 *   reader (decode, dedicated thread)
 * - N transform workers running pack_frame() / unpack_frame()
 * - one reassembly thread that exclusively owns the cursor, the reorder
 *   buffer and the destination (encoder pipe or output file)
 *
 * Stages are connected by Channel<Frame>; frame ownership moves with
 * the frame.
 */

#include "pipeline.hpp"
#include "channel.hpp"
#include "chunker.hpp"
#include "dotmatrix.hpp"
#include "errors.hpp"
#include "frame_dump.hpp"
#include "output_file.hpp"
#include "reorder.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace dotvid {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

/**
 * First error raised by any pipeline thread
 */
class ErrorLatch {
public:
    void capture(std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!first_) {
            first_ = error;
        }
    }

    bool failed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(first_);
    }

    void rethrow_if_failed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (first_) {
            std::rethrow_exception(first_);
        }
    }

private:
    mutable std::mutex mutex_;
    std::exception_ptr first_;
};

} // anonymous namespace

FramePipeline::FramePipeline(const PipelineConfig& config)
    : config_(config)
{
}

void FramePipeline::maybe_dump(uint64_t index, const std::vector<uint8_t>& pixels, uint32_t channels) const
{
    if (config_.dump_frames_dir.empty() || index >= config_.dump_frame_limit) {
        return;
    }

    // A failed dump is only a diagnostic loss
    const std::string path = frame_dump_path(config_.dump_frames_dir, index);
    if (!write_frame_png(path, pixels, config_.geometry, channels)) {
        std::cerr << "Warning: could not dump frame " << index << " to " << path << std::endl;
    }
}

void FramePipeline::encode(FrameSink& sink)
{
    if (!config_.geometry.is_valid()) {
        throw ConfigError("invalid frame geometry");
    }
    if (config_.threads == 0) {
        throw ConfigError("at least one worker thread is required");
    }

    const auto run_start = Clock::now();
    const FrameGeometry geometry = config_.geometry;
    const size_t capacity = geometry.payload_capacity();

    stats_ = PipelineStats();
    stats_.decoding = false;
    stats_.threads = config_.threads;

    std::ifstream input(config_.input_path, std::ios::binary | std::ios::ate);
    if (!input) {
        throw IoError(errno_message("Failed to open " + config_.input_path));
    }
    const std::streamoff end = input.tellg();
    if (end < 0) {
        throw IoError("Failed to determine the size of " + config_.input_path);
    }
    input.seekg(0);

    const uint64_t length = static_cast<uint64_t>(end);
    Chunker chunker(input, length, capacity);
    const uint64_t expected_frames = chunker.frame_count();

    if (!config_.dump_frames_dir.empty() && !ensure_directory(config_.dump_frames_dir)) {
        throw IoError("Cannot create frame dump directory " + config_.dump_frames_dir);
    }

    stats_.original_length = length;
    stats_.setup_ms = elapsed_ms(run_start);
    std::cout << "Read data in: " << std::fixed << std::setprecision(1)
              << stats_.setup_ms << " ms (" << length << " bytes, "
              << expected_frames << " frames)" << std::endl;

    Channel<Frame> raw_frames;
    Channel<Frame> packed_frames;
    ErrorLatch latch;

    auto fail = [&](std::exception_ptr error) {
        latch.capture(error);
        raw_frames.close();
        packed_frames.close();
    };

    // Reassembly: sole owner of the sink
    uint64_t bytes_emitted = 0;
    size_t peak_depth = 0;
    std::thread emitter_thread([&]() {
        try {
            const auto open_start = Clock::now();
            sink.start();
            std::cout << "Opened encoder in: " << std::fixed << std::setprecision(1)
                      << elapsed_ms(open_start) << " ms" << std::endl;

            OrderedEmitter emitter(sink);
            Frame frame;
            while (packed_frames.receive(frame)) {
                emitter.accept(std::move(frame));
            }

            bytes_emitted = emitter.bytes_emitted();
            peak_depth = emitter.buffer().peak_size();
            if (!latch.failed()) {
                emitter.finish(expected_frames);
            }
        }
        catch (...) {
            fail(std::current_exception());
        }
    });

    const auto transform_start = Clock::now();
    std::vector<std::thread> workers;
    try {
        workers.reserve(config_.threads);
        for (uint32_t w = 0; w < config_.threads; ++w) {
            workers.emplace_back([&]() {
                try {
                    Frame frame;
                    while (raw_frames.receive(frame)) {
                        frame.payload = pack_frame(frame.payload, geometry);
                        maybe_dump(frame.index, frame.payload, PACK_CHANNELS);
                        if (!packed_frames.send(std::move(frame))) {
                            break;
                        }
                    }
                }
                catch (...) {
                    fail(std::current_exception());
                }
            });
        }
    }
    catch (const std::exception&) {
        // Threads already running are joined below
        fail(std::current_exception());
    }

    // Chunking runs on the calling thread
    try {
        Frame frame;
        while (!latch.failed() && chunker.next(frame)) {
            if (!raw_frames.send(std::move(frame))) {
                break;
            }
            frame = Frame();
        }
    }
    catch (...) {
        fail(std::current_exception());
    }

    raw_frames.close();
    for (auto& worker : workers) {
        worker.join();
    }
    stats_.transform_ms = elapsed_ms(transform_start);
    std::cout << "Frames digested in: " << std::fixed << std::setprecision(1)
              << stats_.transform_ms << " ms" << std::endl;

    packed_frames.close();
    emitter_thread.join();

    latch.rethrow_if_failed();

    sink.close();

    stats_.frames = expected_frames;
    stats_.input_bytes = length;
    stats_.output_bytes = bytes_emitted;
    stats_.peak_reorder_depth = peak_depth;
    stats_.total_ms = elapsed_ms(run_start);
}

void FramePipeline::decode(FrameSource& source)
{
    if (!config_.geometry.is_valid()) {
        throw ConfigError("invalid frame geometry");
    }
    if (config_.threads == 0) {
        throw ConfigError("at least one worker thread is required");
    }

    const auto run_start = Clock::now();
    const FrameGeometry geometry = config_.geometry;
    const size_t capacity = geometry.payload_capacity();

    stats_ = PipelineStats();
    stats_.decoding = true;
    stats_.threads = config_.threads;

    if (source.frame_bytes() != geometry.pixel_bytes(UNPACK_CHANNELS)) {
        throw ConfigError("decoder frame size does not match the frame geometry");
    }

    if (!config_.dump_frames_dir.empty() && !ensure_directory(config_.dump_frames_dir)) {
        throw IoError("Cannot create frame dump directory " + config_.dump_frames_dir);
    }

    Channel<Frame> raw_frames;
    Channel<Frame> unpacked_frames;
    ErrorLatch latch;

    auto fail = [&](std::exception_ptr error) {
        latch.capture(error);
        raw_frames.close();
        unpacked_frames.close();
    };

    // Reassembly: sole owner of the output file
    uint64_t frames_written = 0;
    uint64_t original_length = 0;
    uint64_t bytes_written = 0;
    uint64_t frames_discarded = 0;
    size_t peak_depth = 0;
    std::thread writer_thread([&]() {
        try {
            OutputFile file;
            file.open(config_.output_path);

            OrderedFileWriter writer(file, capacity);
            Frame frame;
            while (unpacked_frames.receive(frame)) {
                writer.accept(std::move(frame));
            }

            peak_depth = writer.buffer().peak_size();
            frames_discarded = writer.frames_discarded();
            if (!latch.failed()) {
                writer.finish();
                file.close();
                frames_written = writer.cursor();
                original_length = writer.original_length();
                bytes_written = writer.bytes_written();
            }
        }
        catch (...) {
            fail(std::current_exception());
        }
    });

    const auto transform_start = Clock::now();
    std::vector<std::thread> workers;
    uint64_t frames_read = 0;
    uint64_t bytes_read = 0;
    std::thread reader_thread;
    try {
        workers.reserve(config_.threads);
        for (uint32_t w = 0; w < config_.threads; ++w) {
            workers.emplace_back([&]() {
                try {
                    Frame frame;
                    while (raw_frames.receive(frame)) {
                        frame.payload = unpack_frame(frame.payload, geometry, UNPACK_CHANNELS);
                        if (!unpacked_frames.send(std::move(frame))) {
                            break;
                        }
                    }
                }
                catch (...) {
                    fail(std::current_exception());
                }
            });
        }

        // Blocking reads from the decoder pipe on a dedicated thread
        reader_thread = std::thread([&]() {
            try {
                const auto open_start = Clock::now();
                source.start();
                std::cout << "Opened decoder in: " << std::fixed << std::setprecision(1)
                          << elapsed_ms(open_start) << " ms" << std::endl;

                bool stopped = false;
                std::vector<uint8_t> pixels;
                while (source.read_frame(pixels)) {
                    bytes_read += pixels.size();
                    maybe_dump(frames_read, pixels, UNPACK_CHANNELS);
                    if (!raw_frames.send(Frame(frames_read++, std::move(pixels)))) {
                        stopped = true;
                        break;
                    }
                    pixels = std::vector<uint8_t>();
                }

                if (!stopped) {
                    source.close();
                }
            }
            catch (...) {
                fail(std::current_exception());
            }
            raw_frames.close();
        });
    }
    catch (const std::exception&) {
        // Threads already running are joined below
        fail(std::current_exception());
    }

    if (reader_thread.joinable()) {
        reader_thread.join();
    }
    for (auto& worker : workers) {
        worker.join();
    }
    stats_.transform_ms = elapsed_ms(transform_start);
    std::cout << "Frames digested in: " << std::fixed << std::setprecision(1)
              << stats_.transform_ms << " ms (" << frames_read << " frames)" << std::endl;

    unpacked_frames.close();
    writer_thread.join();

    latch.rethrow_if_failed();

    stats_.frames = frames_written;
    stats_.original_length = original_length;
    stats_.input_bytes = bytes_read;
    stats_.output_bytes = bytes_written;
    stats_.frames_discarded = frames_discarded;
    stats_.peak_reorder_depth = peak_depth;
    stats_.total_ms = elapsed_ms(run_start);
}

void FramePipeline::print_summary() const
{
    std::cout << std::endl;
    std::cout << "=== " << (stats_.decoding ? "Decode" : "Encode") << " Summary ===" << std::endl;
    std::cout << "Frames: " << stats_.frames << std::endl;
    std::cout << "Original size: " << stats_.original_length << " bytes" << std::endl;
    std::cout << "Input: " << std::fixed << std::setprecision(2)
              << (stats_.input_bytes / 1024.0 / 1024.0) << " MB" << std::endl;
    std::cout << "Output: " << std::fixed << std::setprecision(2)
              << (stats_.output_bytes / 1024.0 / 1024.0) << " MB" << std::endl;
    if (stats_.frames_discarded > 0) {
        std::cout << "Trailing frames discarded: " << stats_.frames_discarded << std::endl;
    }
    std::cout << "Peak reorder depth: " << stats_.peak_reorder_depth
              << " frames (" << stats_.threads << " workers)" << std::endl;
    std::cout << "Total time: " << std::fixed << std::setprecision(1) << stats_.total_ms << " ms" << std::endl;
    std::cout << "Throughput: " << std::fixed << std::setprecision(1)
              << stats_.throughput_fps() << " fps, "
              << std::setprecision(2) << stats_.throughput_mbps() << " MB/s" << std::endl;
}

bool FramePipeline::write_statistics(const std::string& output_path) const
{
    std::ofstream ofs(output_path);
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << output_path << std::endl;
        return false;
    }

    ofs << stats_.to_json() << "\n";
    std::cout << "Statistics written to " << output_path << std::endl;
    return true;
}

} // namespace dotvid
