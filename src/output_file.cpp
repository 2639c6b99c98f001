/**
 * @file output_file.cpp
 * @brief POSIX positional file output
 */

#include "output_file.hpp"
#include "errors.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace dotvid {

OutputFile::OutputFile()
    : fd_(-1)
{
}

OutputFile::~OutputFile()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void OutputFile::open(const std::string& path)
{
    if (fd_ >= 0) {
        close();
    }

    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw IoError(errno_message("Failed to create " + path));
    }
    path_ = path;
}

void OutputFile::truncate(uint64_t length)
{
    if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
        throw IoError(errno_message("Failed to truncate " + path_));
    }
}

void OutputFile::write_at(const uint8_t* data, size_t size, uint64_t offset)
{
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError(errno_message("Failed to write " + path_));
        }
        data += written;
        size -= static_cast<size_t>(written);
        offset += static_cast<uint64_t>(written);
    }
}

void OutputFile::close()
{
    if (fd_ < 0) {
        return;
    }

    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw IoError(errno_message("Failed to close " + path_));
    }
}

} // namespace dotvid
