#pragma once

#include <stdexcept>
#include <string>

namespace dotvid {

/**
 * Failure classes surfaced by the pipeline
 */
enum class ErrorKind {
    IO,         // read/write/pipe failures
    PROCESS,    // codec process failed to start or exited with an error
    INTEGRITY,  // frames missing or delivered twice at reassembly
    CONFIG      // invalid configuration reached the pipeline
};

const char* error_kind_name(ErrorKind kind);

/**
 * Base class for every unrecoverable pipeline error
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class IoError : public PipelineError {
public:
    explicit IoError(const std::string& message)
        : PipelineError(ErrorKind::IO, message) {}
};

class ProcessError : public PipelineError {
public:
    explicit ProcessError(const std::string& message)
        : PipelineError(ErrorKind::PROCESS, message) {}
};

class IntegrityError : public PipelineError {
public:
    explicit IntegrityError(const std::string& message)
        : PipelineError(ErrorKind::INTEGRITY, message) {}
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message)
        : PipelineError(ErrorKind::CONFIG, message) {}
};

/// Message for the current errno, prefixed with what was attempted.
std::string errno_message(const std::string& what);

} // namespace dotvid
