#include "errors.hpp"
#include "fake_link.hpp"
#include "print_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

TransportSettings quiet() {
    TransportSettings settings;
    settings.chunk_delay_ms = 0;
    settings.progress = false;
    return settings;
}

PixelBuffer diagonal_image(int w, int h) {
    PixelBuffer img(w, h);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            uint8_t v = (uint8_t)(((x + y) * 255) / (w + h));
            uint8_t* p = img.pixel(x, y);
            p[0] = v;
            p[1] = (uint8_t)(255 - v);
            p[2] = (uint8_t)(v / 2);
        }
    }
    return img;
}

// Rebuild the printed bitmap from the bytes the link received
MonoBitmap printed_bitmap(const std::vector<uint8_t>& stream, const PackOptions& pack) {
    std::vector<std::vector<uint8_t>> rows;
    for (const auto& frame : parse_frames(stream)) {
        if (frame.opcode == (uint8_t)Opcode::BitmapRows) {
            for (size_t off = 0; off < frame.payload.size(); off += RASTER_BYTES_PER_ROW) {
                std::vector<uint8_t> packed(frame.payload.begin() + off,
                                            frame.payload.begin() + off + RASTER_BYTES_PER_ROW);
                rows.push_back(unpack_row(packed, RASTER_WIDTH, pack));
            }
        }
    }

    MonoBitmap bitmap(RASTER_WIDTH, (int)rows.size());
    for (size_t y = 0; y < rows.size(); y++) {
        for (int x = 0; x < RASTER_WIDTH; x++) {
            bitmap.set(x, (int)y, rows[y][x] != 0);
        }
    }
    return bitmap;
}

class PrintQueueTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRadio> radio = std::make_shared<FakeRadio>();
    PrinterConnection connection{BleTarget(), fake_factory(radio)};
    CatPrinter printer{connection, quiet()};
};

}  // namespace

TEST_F(PrintQueueTest, JobsRunInSubmissionOrder) {
    PrintSpooler spooler(printer);
    std::vector<std::vector<CommandFrame>> jobs;
    std::vector<std::future<void>> results;
    for (int period = 3; period < 8; period++) {
        jobs.push_back(encode_job(pattern_bitmap(4, period), JobSettings()));
        results.push_back(spooler.submit(jobs.back()));
    }
    for (auto& result : results) {
        EXPECT_NO_THROW(result.get());
    }

    std::vector<uint8_t> expected;
    for (const auto& job : jobs) {
        auto bytes = serialize_frames(job);
        expected.insert(expected.end(), bytes.begin(), bytes.end());
    }
    EXPECT_EQ(radio->stream(), expected);
    EXPECT_EQ(radio->opens, 1);
}

TEST_F(PrintQueueTest, QueuedJobWaitsForTheRunningOne) {
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    radio->on_write = [&](size_t index) {
        if (index == 0) {
            started.set_value();
            released.wait();
        }
    };

    PrintSpooler spooler(printer);
    auto first = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));
    auto second = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));
    auto third = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));

    started.get_future().wait();
    EXPECT_EQ(spooler.pending(), 2u);
    EXPECT_EQ(connection.state(), PrinterConnection::State::Writing);

    release.set_value();
    first.get();
    second.get();
    third.get();
    EXPECT_EQ(spooler.pending(), 0u);
}

TEST_F(PrintQueueTest, FailureSurfacesThroughTheFuture) {
    radio->fail_at = 1;
    PrintSpooler spooler(printer);

    auto failed = spooler.submit(encode_job(pattern_bitmap(4), JobSettings()));
    EXPECT_THROW(failed.get(), ConnectionLost);

    auto frames = encode_job(pattern_bitmap(4), JobSettings());
    auto next = spooler.submit(frames);
    EXPECT_NO_THROW(next.get());
    EXPECT_EQ(radio->opens, 2);
}

TEST_F(PrintQueueTest, CancelTokenStopsAQueuedJob) {
    PrintSpooler spooler(printer);
    auto cancel = std::make_shared<CancelToken>();
    cancel->cancel();

    auto result = spooler.submit(encode_job(pattern_bitmap(4), JobSettings()), cancel);
    EXPECT_THROW(result.get(), CancellationError);
    EXPECT_TRUE(radio->writes.empty());
}

TEST_F(PrintQueueTest, ShutdownFailsQueuedJobs) {
    std::promise<void> started;
    radio->on_write = [&](size_t index) {
        if (index == 0) {
            started.set_value();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    };

    std::future<void> running, queued_1, queued_2;
    {
        PrintSpooler spooler(printer);
        running = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));
        queued_1 = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));
        queued_2 = spooler.submit(encode_job(pattern_bitmap(2), JobSettings()));
        started.get_future().wait();
    }

    EXPECT_NO_THROW(running.get());
    EXPECT_THROW(queued_1.get(), CancellationError);
    EXPECT_THROW(queued_2.get(), CancellationError);
}

// --- PrintService ---

TEST_F(PrintQueueTest, PreviewMatchesPrintedRows) {
    PrintSpooler spooler(printer);
    JobSettings job;
    PrintService service(spooler, RenderSettings(), job);

    MonoBitmap previewed;
    int preview_calls = 0;
    service.set_preview([&](const MonoBitmap& bitmap) {
        previewed = bitmap;
        preview_calls++;
    });

    service.print(diagonal_image(200, 60)).get();

    ASSERT_EQ(preview_calls, 1);
    EXPECT_EQ(previewed.width, RASTER_WIDTH);
    EXPECT_EQ(previewed.height, 115);
    EXPECT_EQ(printed_bitmap(radio->stream(), job.pack), previewed);
}

TEST_F(PrintQueueTest, PreviewMatchesWithBatchedRows) {
    PrintSpooler spooler(printer);
    JobSettings job;
    job.rows_per_command = 4;
    job.pack.mirror = false;
    PrintService service(spooler, RenderSettings(), job);

    MonoBitmap previewed;
    service.set_preview([&](const MonoBitmap& bitmap) { previewed = bitmap; });
    service.print(diagonal_image(384, 30)).get();

    EXPECT_EQ(printed_bitmap(radio->stream(), job.pack), previewed);
}

TEST_F(PrintQueueTest, UndecodableImageFailsThroughTheFuture) {
    PrintSpooler spooler(printer);
    PrintService service(spooler, RenderSettings(), JobSettings());

    bool previewed = false;
    service.set_preview([&](const MonoBitmap&) { previewed = true; });

    auto result = service.print(PixelBuffer());
    EXPECT_THROW(result.get(), DecodeError);
    EXPECT_FALSE(previewed);
    EXPECT_EQ(radio->opens, 0);
}

TEST_F(PrintQueueTest, OversizedBatchFailsBeforeSending) {
    PrintSpooler spooler(printer);
    JobSettings job;
    job.rows_per_command = 8;
    PrintService service(spooler, RenderSettings(), job);

    auto result = service.print(diagonal_image(384, 40));
    EXPECT_THROW(result.get(), FrameTooLarge);
    EXPECT_TRUE(radio->writes.empty());
}

TEST_F(PrintQueueTest, BlankTextIsRejected) {
    PrintSpooler spooler(printer);
    PrintService service(spooler, RenderSettings(), JobSettings());

    EXPECT_THROW(service.render_text(" \n\t "), std::invalid_argument);
    auto result = service.print_text("");
    EXPECT_THROW(result.get(), std::invalid_argument);
    EXPECT_EQ(radio->opens, 0);
}

TEST_F(PrintQueueTest, TextJobUsesTextDrawingMode) {
    RenderSettings render;
    render.text.font_path = CATPRINT_TEST_FONT;
    PrintSpooler spooler(printer);
    PrintService service(spooler, render, JobSettings());

    MonoBitmap previewed;
    service.set_preview([&](const MonoBitmap& bitmap) { previewed = bitmap; });
    service.print_text("Hello").get();

    EXPECT_EQ(previewed.height, 32);
    auto frames = parse_frames(radio->stream());
    ASSERT_GE(frames.size(), 3u);
    EXPECT_EQ(frames[2].opcode, (uint8_t)Opcode::DrawingMode);
    EXPECT_EQ(frames[2].payload, std::vector<uint8_t>{1});
}

// --- Preview output ---

TEST(Preview, InkIsBlackPaperIsWhite) {
    MonoBitmap bitmap(4, 2);
    bitmap.set(1, 0, true);
    bitmap.set(3, 1, true);

    PixelBuffer pixels = bitmap_to_pixels(bitmap);
    ASSERT_EQ(pixels.width, 4);
    ASSERT_EQ(pixels.height, 2);
    EXPECT_EQ(pixels.pixel(1, 0)[0], 0);
    EXPECT_EQ(pixels.pixel(3, 1)[2], 0);
    EXPECT_EQ(pixels.pixel(0, 0)[0], 255);
    EXPECT_EQ(pixels.pixel(0, 0)[3], 255);
}

TEST(Preview, PngLoadsBackAsTheBitmap) {
    MonoBitmap bitmap = pattern_bitmap(12);
    std::string path = ::testing::TempDir() + "catprint_preview.png";
    write_preview_png(bitmap, path);

    MonoBitmap loaded = dither_none(load_image(path.c_str()));
    EXPECT_EQ(loaded, bitmap);
    std::remove(path.c_str());
}

TEST(Preview, UnwritablePathThrows) {
    EXPECT_THROW(write_preview_png(pattern_bitmap(2), "/nonexistent/dir/preview.png"),
                 std::runtime_error);
}
