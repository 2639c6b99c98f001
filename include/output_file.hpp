#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dotvid {

/**
 * @brief Destination file written at explicit byte offsets
 *
 * Positional writes let frames land at their final offset without
 * append semantics. Errors throw IoError.
 */
class OutputFile {
public:
    OutputFile();
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    /**
     * Create the file, or truncate it if it already exists
     */
    void open(const std::string& path);

    /**
     * Set the file length
     */
    void truncate(uint64_t length);

    /**
     * Write size bytes at offset, retrying short writes
     */
    void write_at(const uint8_t* data, size_t size, uint64_t offset);

    /**
     * Close the descriptor, reporting a failed close
     */
    void close();

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

private:
    int fd_;
    std::string path_;
};

} // namespace dotvid
