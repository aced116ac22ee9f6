#pragma once

#include "ble_transport.hpp"
#include "protocol.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/// Set by the caller to stop a job before its next chunk
class CancelToken {
public:
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

/// Lazily opened, cached link to the printer. One holder at a time.
class PrinterConnection {
public:
    enum class State {
        Unconnected,
        Discovering,
        Connected,
        Writing,
    };

    using LinkFactory = std::function<std::unique_ptr<BleLink>()>;

    /// Exclusive access to the open link for the duration of one job
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        BleLink& link();

        /// Mark the link as carrying job data
        void begin_writing();

        /// Drop the cached link; the next acquire() discovers again
        void invalidate();

    private:
        friend class PrinterConnection;
        Lease(PrinterConnection& owner, std::unique_lock<std::mutex> lock);

        PrinterConnection* owner_;
        std::unique_lock<std::mutex> lock_;
    };

    PrinterConnection(BleTarget target, LinkFactory factory);
    ~PrinterConnection();

    /// Block until no other job holds the link, then open it if needed.
    /// Throws DeviceNotFound.
    Lease acquire();

    /// Close and forget the cached link
    void invalidate();

    State state() const { return state_; }

    const BleTarget& target() const { return target_; }

private:
    void drop_link();

    BleTarget target_;
    LinkFactory factory_;
    std::mutex mutex_;
    std::atomic<State> state_{State::Unconnected};
    std::unique_ptr<BleLink> link_;
};

/// Chunking and pacing of the byte stream
struct TransportSettings {
    size_t chunk_size = 64;
    int chunk_delay_ms = 20;
    bool progress = true;  // print "\rChunk i/n" lines
};

/// Delivers framed jobs to the printer over a shared connection
class CatPrinter {
public:
    CatPrinter(PrinterConnection& connection, TransportSettings settings = {});

    /// Send every frame, in order, then return. Throws DeviceNotFound,
    /// ConnectionLost, WriteFailed or CancellationError.
    void send(const std::vector<CommandFrame>& frames, const CancelToken* cancel = nullptr);

    const TransportSettings& settings() const { return settings_; }

private:
    PrinterConnection& connection_;
    TransportSettings settings_;
};
