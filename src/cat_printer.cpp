#include "cat_printer.hpp"
#include "errors.hpp"
#include "image.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

// ==================== PrinterConnection ====================

PrinterConnection::PrinterConnection(BleTarget target, LinkFactory factory)
    : target_(std::move(target)), factory_(std::move(factory)) {}

PrinterConnection::~PrinterConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_link();
}

void PrinterConnection::drop_link() {
    if (link_) {
        link_->close();
        link_.reset();
    }
    state_ = State::Unconnected;
}

PrinterConnection::Lease PrinterConnection::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!link_ || !link_->is_open()) {
        state_ = State::Discovering;
        try {
            link_ = factory_();
            link_->open(target_);
        } catch (...) {
            link_.reset();
            state_ = State::Unconnected;
            throw;
        }
    }

    state_ = State::Connected;
    return Lease(*this, std::move(lock));
}

void PrinterConnection::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_link();
}

PrinterConnection::Lease::Lease(PrinterConnection& owner, std::unique_lock<std::mutex> lock)
    : owner_(&owner), lock_(std::move(lock)) {}

PrinterConnection::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), lock_(std::move(other.lock_)) {
    other.owner_ = nullptr;
}

PrinterConnection::Lease::~Lease() {
    if (owner_ && owner_->link_) {
        owner_->state_ = State::Connected;
    }
}

BleLink& PrinterConnection::Lease::link() {
    return *owner_->link_;
}

void PrinterConnection::Lease::begin_writing() {
    owner_->state_ = State::Writing;
}

void PrinterConnection::Lease::invalidate() {
    owner_->drop_link();
}

// ==================== CatPrinter ====================

CatPrinter::CatPrinter(PrinterConnection& connection, TransportSettings settings)
    : connection_(connection), settings_(settings) {}

void CatPrinter::send(const std::vector<CommandFrame>& frames, const CancelToken* cancel) {
    if (cancel && cancel->cancelled()) {
        throw CancellationError("Print job cancelled before start");
    }

    auto lease = connection_.acquire();
    BleLink& link = lease.link();

    auto stream = serialize_frames(frames);
    size_t chunk_size = std::min(settings_.chunk_size, link.max_write_size());
    auto chunks = make_chunks(stream, chunk_size);

    lease.begin_writing();
    for (size_t i = 0; i < chunks.size(); i++) {
        if (cancel && cancel->cancelled()) {
            if (settings_.progress) std::cout << std::endl;
            throw CancellationError("Print job cancelled after " + std::to_string(i) + " of " +
                                    std::to_string(chunks.size()) + " chunks");
        }

        try {
            link.write(chunks[i]);
        } catch (const ConnectionLost&) {
            lease.invalidate();
            throw;
        } catch (const WriteFailed&) {
            lease.invalidate();
            throw;
        }

        if (settings_.progress) {
            std::cout << "\rChunk " << (i + 1) << "/" << chunks.size() << " " << std::flush;
        }

        // The link has no backpressure; pace writes blindly
        if (i + 1 < chunks.size() && settings_.chunk_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.chunk_delay_ms));
        }
    }
    if (settings_.progress) std::cout << std::endl;
}
