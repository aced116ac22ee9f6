#pragma once

#include <stdexcept>
#include <string>

/// Base class of every failure a print job can end with
class PrintError : public std::runtime_error {
public:
    enum class Kind {
        Decode,
        FrameTooLarge,
        DeviceNotFound,
        ConnectionLost,
        WriteFailed,
        Cancelled,
    };

    PrintError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/// Input could not be decoded as an image
class DecodeError : public PrintError {
public:
    explicit DecodeError(const std::string& what) : PrintError(Kind::Decode, what) {}
};

/// A command payload exceeds the printer's frame limit
class FrameTooLarge : public PrintError {
public:
    explicit FrameTooLarge(const std::string& what) : PrintError(Kind::FrameTooLarge, what) {}
};

/// No adapter, no matching printer, or the connection attempt failed
class DeviceNotFound : public PrintError {
public:
    explicit DeviceNotFound(const std::string& what) : PrintError(Kind::DeviceNotFound, what) {}
};

/// The printer went away in the middle of a job
class ConnectionLost : public PrintError {
public:
    explicit ConnectionLost(const std::string& what) : PrintError(Kind::ConnectionLost, what) {}
};

/// The link rejected a write
class WriteFailed : public PrintError {
public:
    explicit WriteFailed(const std::string& what) : PrintError(Kind::WriteFailed, what) {}
};

/// The caller aborted the job; chunks already written stay written
class CancellationError : public PrintError {
public:
    explicit CancellationError(const std::string& what) : PrintError(Kind::Cancelled, what) {}
};

/// Short message suitable for showing to a user
const char* user_message(const PrintError& error);
