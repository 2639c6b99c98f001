/**
 * @file codec_process.cpp
 * @brief ffmpeg process boundary and in-memory stand-ins
 *
 * The encoder reads raw RGBA frames on stdin; the decoder writes raw
 * RGB24 frames on stdout. Both run through popen().
 */

#include "codec_process.hpp"
#include "dotmatrix.hpp"
#include "errors.hpp"
#include <sstream>
#include <utility>
#include <sys/wait.h>

namespace dotvid {

namespace {

// pclose() status to a description, empty on a clean exit
std::string describe_exit(int status)
{
    if (status == -1) {
        return errno_message("pclose failed");
    }
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 0) {
            return std::string();
        }
        if (code == 127) {
            return "exited with status 127 (ffmpeg not found?)";
        }
        return "exited with status " + std::to_string(code);
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "terminated abnormally";
}

} // anonymous namespace

std::string shell_quote(const std::string& arg)
{
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        }
        else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string build_encoder_command(
    const CodecSettings& settings,
    const FrameGeometry& geometry,
    const std::string& video_path)
{
    std::ostringstream cmd;
    cmd << shell_quote(settings.ffmpeg_path)
        << " -y -hide_banner -loglevel " << shell_quote(settings.log_level)
        << " -f rawvideo -pix_fmt rgba"
        << " -s " << geometry.width << "x" << geometry.height
        << " -framerate " << settings.framerate
        << " -i -"
        << " -c:v " << shell_quote(settings.video_codec)
        << " -b:v " << shell_quote(settings.bitrate)
        << " -r " << settings.framerate
        << " -g " << settings.gop
        << " -an";
    if (!settings.preset.empty()) {
        cmd << " -preset " << shell_quote(settings.preset);
    }
    cmd << " " << shell_quote(video_path);
    return cmd.str();
}

std::string build_decoder_command(
    const CodecSettings& settings,
    const std::string& video_path)
{
    std::ostringstream cmd;
    cmd << shell_quote(settings.ffmpeg_path)
        << " -hide_banner -loglevel " << shell_quote(settings.log_level)
        << " -i " << shell_quote(video_path)
        << " -vf format=rgb24 -pix_fmt rgb24 -f rawvideo -an -";
    return cmd.str();
}

// ============================================================================
// FfmpegEncoderSink
// ============================================================================

FfmpegEncoderSink::FfmpegEncoderSink(
    const CodecSettings& settings,
    const FrameGeometry& geometry,
    const std::string& video_path)
    : command_(build_encoder_command(settings, geometry, video_path))
    , pipe_(nullptr)
{
}

FfmpegEncoderSink::~FfmpegEncoderSink()
{
    if (pipe_) {
        pclose(pipe_);
    }
}

void FfmpegEncoderSink::start()
{
    pipe_ = popen(command_.c_str(), "w");
    if (!pipe_) {
        throw ProcessError(errno_message("Failed to start encoder"));
    }
}

void FfmpegEncoderSink::write(const uint8_t* data, size_t size)
{
    if (!pipe_) {
        throw ProcessError("Encoder process is not running");
    }
    if (fwrite(data, 1, size, pipe_) != size) {
        const std::string write_error = errno_message("Failed to write to encoder");

        // A broken pipe usually means ffmpeg is gone; report how it exited
        FILE* pipe = pipe_;
        pipe_ = nullptr;
        const std::string failure = describe_exit(pclose(pipe));
        if (!failure.empty()) {
            throw ProcessError("Encoder " + failure + " (" + write_error + ")");
        }
        throw IoError(write_error);
    }
}

void FfmpegEncoderSink::close()
{
    if (!pipe_) {
        return;
    }

    FILE* pipe = pipe_;
    pipe_ = nullptr;
    const std::string failure = describe_exit(pclose(pipe));
    if (!failure.empty()) {
        throw ProcessError("Encoder " + failure);
    }
}

// ============================================================================
// FfmpegDecoderSource
// ============================================================================

FfmpegDecoderSource::FfmpegDecoderSource(
    const CodecSettings& settings,
    const FrameGeometry& geometry,
    const std::string& video_path)
    : command_(build_decoder_command(settings, video_path))
    , frame_bytes_(geometry.pixel_bytes(UNPACK_CHANNELS))
    , pipe_(nullptr)
{
}

FfmpegDecoderSource::~FfmpegDecoderSource()
{
    if (pipe_) {
        pclose(pipe_);
    }
}

void FfmpegDecoderSource::start()
{
    pipe_ = popen(command_.c_str(), "r");
    if (!pipe_) {
        throw ProcessError(errno_message("Failed to start decoder"));
    }
}

bool FfmpegDecoderSource::read_frame(std::vector<uint8_t>& frame)
{
    if (!pipe_) {
        throw ProcessError("Decoder process is not running");
    }

    frame.resize(frame_bytes_);
    size_t filled = 0;
    while (filled < frame_bytes_) {
        const size_t n = fread(frame.data() + filled, 1, frame_bytes_ - filled, pipe_);
        filled += n;
        if (n == 0) {
            if (ferror(pipe_)) {
                throw IoError(errno_message("Failed to read from decoder"));
            }
            break;
        }
    }

    if (filled == 0) {
        return false;
    }
    if (filled < frame_bytes_) {
        throw IoError("Decoder stream ended inside a frame (" + std::to_string(filled)
                      + " of " + std::to_string(frame_bytes_) + " bytes)");
    }
    return true;
}

void FfmpegDecoderSource::close()
{
    if (!pipe_) {
        return;
    }

    FILE* pipe = pipe_;
    pipe_ = nullptr;
    const std::string failure = describe_exit(pclose(pipe));
    if (!failure.empty()) {
        throw ProcessError("Decoder " + failure);
    }
}

// ============================================================================
// In-memory codec
// ============================================================================

MemoryFrameSink::MemoryFrameSink(const FrameGeometry& geometry)
    : geometry_(geometry)
{
}

void MemoryFrameSink::write(const uint8_t* data, size_t size)
{
    data_.insert(data_.end(), data, data + size);
}

void MemoryFrameSink::close()
{
    if (data_.size() % geometry_.pixel_bytes(PACK_CHANNELS) != 0) {
        throw IoError("Sink received a partial frame");
    }
}

size_t MemoryFrameSink::frames_written() const
{
    return data_.size() / geometry_.pixel_bytes(PACK_CHANNELS);
}

std::vector<uint8_t> MemoryFrameSink::to_rgb24() const
{
    std::vector<uint8_t> rgb;
    strip_alpha(data_.data(), data_.size() / PACK_CHANNELS, rgb);
    return rgb;
}

MemoryFrameSource::MemoryFrameSource(const FrameGeometry& geometry, std::vector<uint8_t> rgb_stream)
    : stream_(std::move(rgb_stream))
    , frame_bytes_(geometry.pixel_bytes(UNPACK_CHANNELS))
    , position_(0)
{
}

bool MemoryFrameSource::read_frame(std::vector<uint8_t>& frame)
{
    if (position_ >= stream_.size()) {
        return false;
    }
    if (stream_.size() - position_ < frame_bytes_) {
        throw IoError("Stream ended inside a frame");
    }

    frame.assign(stream_.begin() + position_, stream_.begin() + position_ + frame_bytes_);
    position_ += frame_bytes_;
    return true;
}

} // namespace dotvid
