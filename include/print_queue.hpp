#pragma once

#include "cat_printer.hpp"
#include "dither.hpp"
#include "image.hpp"
#include "preview.hpp"
#include "text.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/// Runs print jobs one after another on a background worker.
/// A job submitted while another is writing waits its turn.
class PrintSpooler {
public:
    explicit PrintSpooler(CatPrinter& printer);

    /// Finishes the running job; queued jobs fail with CancellationError
    ~PrintSpooler();

    PrintSpooler(const PrintSpooler&) = delete;
    PrintSpooler& operator=(const PrintSpooler&) = delete;

    std::future<void> submit(std::vector<CommandFrame> frames,
                             std::shared_ptr<CancelToken> cancel = nullptr);

    /// Jobs waiting behind the running one
    size_t pending() const;

private:
    struct Job {
        std::vector<CommandFrame> frames;
        std::shared_ptr<CancelToken> cancel;
        std::promise<void> done;
    };

    void run();

    CatPrinter& printer_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread worker_;
};

/// How images and text become bitmaps
struct RenderSettings {
    DitherMethod dither = DitherMethod::Atkinson;
    TextConfig text;
};

/// Entry points used by a front end: turn an image or text into a bitmap,
/// show it through the preview callback, then queue it for printing
class PrintService {
public:
    PrintService(PrintSpooler& spooler, RenderSettings render, JobSettings job);

    void set_preview(PreviewCallback callback) { preview_ = std::move(callback); }

    /// Normalize to the raster width and dither. Throws DecodeError.
    MonoBitmap render_image(const PixelBuffer& decoded) const;

    /// Rasterize and threshold text. Throws std::invalid_argument on blank text.
    MonoBitmap render_text(const std::string& text) const;

    /// Print a decoded image. Rendering errors are reported through the future.
    std::future<void> print(const PixelBuffer& decoded, std::shared_ptr<CancelToken> cancel = nullptr);

    std::future<void> print_text(const std::string& text, std::shared_ptr<CancelToken> cancel = nullptr);

    /// Print an already rendered bitmap exactly as given
    std::future<void> print_bitmap(const MonoBitmap& bitmap, bool text_mode = false,
                                   std::shared_ptr<CancelToken> cancel = nullptr);

private:
    PrintSpooler& spooler_;
    RenderSettings render_;
    JobSettings job_;
    PreviewCallback preview_;
};
