#include "image.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

std::vector<uint8_t> pack_row(const MonoBitmap& bitmap, int y, const PackOptions& options) {
    int width = bitmap.width;
    int bytes_per_row = (width + 7) / 8;
    std::vector<uint8_t> row_bytes(bytes_per_row, 0);

    for (int x = 0; x < width; x++) {
        int src_x = options.mirror ? width - 1 - x : x;
        bool bit = bitmap.at(src_x, y) != options.invert;
        if (bit) {
            row_bytes[x / 8] |= static_cast<uint8_t>(0x80 >> (x % 8));
        }
    }

    // Padding bits past the bitmap width follow the same polarity as paper
    if (options.invert) {
        for (int x = width; x < bytes_per_row * 8; x++) {
            row_bytes[x / 8] |= static_cast<uint8_t>(0x80 >> (x % 8));
        }
    }

    return row_bytes;
}

std::vector<uint8_t> unpack_row(const std::vector<uint8_t>& packed, int width,
                                const PackOptions& options) {
    if ((int)packed.size() * 8 < width) {
        throw std::invalid_argument("Packed row is shorter than the requested width");
    }

    std::vector<uint8_t> ink(width, 0);
    for (int x = 0; x < width; x++) {
        bool bit = (packed[x / 8] & (0x80 >> (x % 8))) != 0;
        int dst_x = options.mirror ? width - 1 - x : x;
        ink[dst_x] = (bit != options.invert) ? 1 : 0;
    }
    return ink;
}

std::vector<std::vector<uint8_t>> pack_bitmap(const MonoBitmap& bitmap, const PackOptions& options) {
    std::vector<std::vector<uint8_t>> rows;
    rows.reserve(bitmap.height);
    for (int y = 0; y < bitmap.height; y++) {
        rows.push_back(pack_row(bitmap, y, options));
    }
    return rows;
}

std::vector<CommandFrame> encode_job(const MonoBitmap& bitmap, const JobSettings& settings) {
    if (bitmap.width != RASTER_WIDTH) {
        throw std::invalid_argument("Bitmap width must be " + std::to_string(RASTER_WIDTH));
    }
    if (settings.rows_per_command < 1) {
        throw std::invalid_argument("rows_per_command must be at least 1");
    }

    std::vector<CommandFrame> frames;
    frames.push_back(build_energy_frame(settings.energy));
    frames.push_back(build_quality_frame(settings.quality));
    frames.push_back(build_drawing_mode_frame(settings.text_mode));
    if (settings.retract_lines > 0) {
        frames.push_back(build_retract_frame(settings.retract_lines));
    }
    frames.push_back(build_lattice_start_frame());

    auto rows = pack_bitmap(bitmap, settings.pack);
    for (size_t first = 0; first < rows.size(); first += settings.rows_per_command) {
        size_t last = std::min(first + settings.rows_per_command, rows.size());
        std::vector<uint8_t> payload;
        for (size_t r = first; r < last; r++) {
            payload.insert(payload.end(), rows[r].begin(), rows[r].end());
        }
        frames.push_back(build_bitmap_frame(payload));
    }

    frames.push_back(build_lattice_stop_frame());
    for (int i = 0; i < settings.feed_commands; i++) {
        frames.push_back(build_feed_frame(settings.feed_lines));
    }

    return frames;
}

std::vector<uint8_t> serialize_frames(const std::vector<CommandFrame>& frames) {
    std::vector<uint8_t> stream;
    for (const auto& frame : frames) {
        stream.insert(stream.end(), frame.bytes.begin(), frame.bytes.end());
    }
    return stream;
}

std::vector<std::vector<uint8_t>> make_chunks(const std::vector<uint8_t>& stream, size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    std::vector<std::vector<uint8_t>> chunks;
    for (size_t i = 0; i < stream.size(); i += chunk_size) {
        size_t end = std::min(i + chunk_size, stream.size());
        chunks.emplace_back(stream.begin() + i, stream.begin() + end);
    }
    return chunks;
}
