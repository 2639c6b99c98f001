#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include "frame.hpp"

namespace dotvid {

/**
 * @brief Settings handed to the external ffmpeg process
 *
 * The pipeline itself only sees a raw pixel stream; everything here
 * concerns how ffmpeg is invoked.
 */
struct CodecSettings {
    std::string ffmpeg_path = "ffmpeg";
    std::string video_codec = "libx264";  // h264_nvenc for GPU encoding
    std::string bitrate = "30M";
    uint32_t framerate = 60;
    uint32_t gop = 300;                   // keyframe interval in frames
    std::string preset = "fast";          // empty to omit -preset
    std::string log_level = "error";
};

/**
 * Consumer of the raw RGBA frame stream (encode direction)
 */
class FrameSink {
public:
    virtual ~FrameSink() {}

    virtual void start() = 0;
    virtual void write(const uint8_t* data, size_t size) = 0;

    /// Flush and wait for the consumer; throws on failure.
    virtual void close() = 0;
};

/**
 * Producer of the raw RGB24 frame stream (decode direction)
 */
class FrameSource {
public:
    virtual ~FrameSource() {}

    virtual void start() = 0;

    /**
     * Read exactly one frame
     * @param frame Resized to the frame size and filled
     * @return false at a clean end of stream
     */
    virtual bool read_frame(std::vector<uint8_t>& frame) = 0;

    virtual void close() = 0;

    /// Bytes per frame delivered by read_frame().
    virtual size_t frame_bytes() const = 0;
};

/**
 * Quote an argument for /bin/sh
 */
std::string shell_quote(const std::string& arg);

/**
 * Command line that encodes an RGBA stream on stdin into a video file
 */
std::string build_encoder_command(
    const CodecSettings& settings,
    const FrameGeometry& geometry,
    const std::string& video_path);

/**
 * Command line that decodes a video file to an RGB24 stream on stdout
 */
std::string build_decoder_command(
    const CodecSettings& settings,
    const std::string& video_path);

/**
 * ffmpeg encoder fed through its stdin pipe
 */
class FfmpegEncoderSink : public FrameSink {
public:
    FfmpegEncoderSink(const CodecSettings& settings,
                      const FrameGeometry& geometry,
                      const std::string& video_path);
    ~FfmpegEncoderSink() override;

    FfmpegEncoderSink(const FfmpegEncoderSink&) = delete;
    FfmpegEncoderSink& operator=(const FfmpegEncoderSink&) = delete;

    void start() override;
    void write(const uint8_t* data, size_t size) override;
    void close() override;

    const std::string& command() const { return command_; }

private:
    std::string command_;
    FILE* pipe_;
};

/**
 * ffmpeg decoder read through its stdout pipe
 */
class FfmpegDecoderSource : public FrameSource {
public:
    FfmpegDecoderSource(const CodecSettings& settings,
                        const FrameGeometry& geometry,
                        const std::string& video_path);
    ~FfmpegDecoderSource() override;

    FfmpegDecoderSource(const FfmpegDecoderSource&) = delete;
    FfmpegDecoderSource& operator=(const FfmpegDecoderSource&) = delete;

    void start() override;
    bool read_frame(std::vector<uint8_t>& frame) override;
    void close() override;
    size_t frame_bytes() const override { return frame_bytes_; }

    const std::string& command() const { return command_; }

private:
    std::string command_;
    size_t frame_bytes_;
    FILE* pipe_;
};

/**
 * In-memory sink that keeps the RGBA stream
 */
class MemoryFrameSink : public FrameSink {
public:
    explicit MemoryFrameSink(const FrameGeometry& geometry);

    void start() override {}
    void write(const uint8_t* data, size_t size) override;
    void close() override;

    const std::vector<uint8_t>& data() const { return data_; }
    size_t frames_written() const;

    /// Stream converted to RGB24, as the decoder side would see it.
    std::vector<uint8_t> to_rgb24() const;

private:
    FrameGeometry geometry_;
    std::vector<uint8_t> data_;
};

/**
 * In-memory source replaying an RGB24 stream frame by frame
 */
class MemoryFrameSource : public FrameSource {
public:
    MemoryFrameSource(const FrameGeometry& geometry, std::vector<uint8_t> rgb_stream);

    void start() override {}
    bool read_frame(std::vector<uint8_t>& frame) override;
    void close() override {}
    size_t frame_bytes() const override { return frame_bytes_; }

private:
    std::vector<uint8_t> stream_;
    size_t frame_bytes_;
    size_t position_;
};

} // namespace dotvid
