#include "print_queue.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

// ==================== PrintSpooler ====================

PrintSpooler::PrintSpooler(CatPrinter& printer)
    : printer_(printer), worker_(&PrintSpooler::run, this) {}

PrintSpooler::~PrintSpooler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    worker_.join();

    for (auto& job : jobs_) {
        job.done.set_exception(std::make_exception_ptr(
            CancellationError("Print spooler shut down before the job started")));
    }
}

std::future<void> PrintSpooler::submit(std::vector<CommandFrame> frames,
                                       std::shared_ptr<CancelToken> cancel) {
    Job job;
    job.frames = std::move(frames);
    job.cancel = std::move(cancel);
    auto future = job.done.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("Print spooler is shutting down");
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return future;
}

size_t PrintSpooler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void PrintSpooler::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            printer_.send(job.frames, job.cancel.get());
            job.done.set_value();
        } catch (...) {
            // Handed to whoever waits on the future
            job.done.set_exception(std::current_exception());
        }
    }
}

// ==================== PrintService ====================

static std::future<void> failed_future(std::exception_ptr error) {
    std::promise<void> promise;
    promise.set_exception(error);
    return promise.get_future();
}

PrintService::PrintService(PrintSpooler& spooler, RenderSettings render, JobSettings job)
    : spooler_(spooler), render_(std::move(render)), job_(job) {}

MonoBitmap PrintService::render_image(const PixelBuffer& decoded) const {
    return dither(normalize_width(decoded), render_.dither);
}

MonoBitmap PrintService::render_text(const std::string& text) const {
    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw std::invalid_argument("Text is empty");
    }

    // Already near-binary; threshold without error diffusion
    return dither_none(::render_text(text, render_.text));
}

std::future<void> PrintService::print(const PixelBuffer& decoded, std::shared_ptr<CancelToken> cancel) {
    MonoBitmap bitmap;
    try {
        bitmap = render_image(decoded);
    } catch (const DecodeError&) {
        return failed_future(std::current_exception());
    }
    return print_bitmap(bitmap, false, std::move(cancel));
}

std::future<void> PrintService::print_text(const std::string& text, std::shared_ptr<CancelToken> cancel) {
    MonoBitmap bitmap;
    try {
        bitmap = render_text(text);
    } catch (const std::exception&) {
        return failed_future(std::current_exception());
    }
    return print_bitmap(bitmap, true, std::move(cancel));
}

std::future<void> PrintService::print_bitmap(const MonoBitmap& bitmap, bool text_mode,
                                             std::shared_ptr<CancelToken> cancel) {
    if (preview_) {
        preview_(bitmap);
    }

    JobSettings settings = job_;
    settings.text_mode = text_mode;

    std::vector<CommandFrame> frames;
    try {
        frames = encode_job(bitmap, settings);
    } catch (const std::exception&) {
        // FrameTooLarge or a bitmap of the wrong width; nothing is sent
        return failed_future(std::current_exception());
    }
    return spooler_.submit(std::move(frames), std::move(cancel));
}
