#pragma once

#include <cstdint>
#include <vector>
#include "protocol.hpp"
#include "raster.hpp"

/// How bitmap rows map onto the printer's bits
struct PackOptions {
    bool invert = true;  // set bit = leave paper white
    bool mirror = true;  // head scans right-to-left
};

/// Settings that shape the command sequence of one print job
struct JobSettings {
    uint16_t energy = 12000;
    uint8_t quality = QUALITY_DEFAULT;
    bool text_mode = false;
    int rows_per_command = 1;
    uint16_t feed_lines = 40;
    uint16_t retract_lines = 0;  // 0: no retract command
    int feed_commands = 2;
    PackOptions pack;
};

/// Most scanlines one bitmap command can carry
static const int MAX_ROWS_PER_COMMAND = static_cast<int>(MAX_PAYLOAD_SIZE) / RASTER_BYTES_PER_ROW;

/// Pack row `y` of the bitmap into width/8 bytes, MSB first
std::vector<uint8_t> pack_row(const MonoBitmap& bitmap, int y, const PackOptions& options = {});

/// Inverse of pack_row: recover the ink flags of one row
std::vector<uint8_t> unpack_row(const std::vector<uint8_t>& packed, int width,
                                const PackOptions& options = {});

/// Pack every row, top to bottom
std::vector<std::vector<uint8_t>> pack_bitmap(const MonoBitmap& bitmap, const PackOptions& options = {});

/// Build the full command sequence for one bitmap:
/// setup, optional retract, bitmap rows top to bottom, lattice stop, feeds
std::vector<CommandFrame> encode_job(const MonoBitmap& bitmap, const JobSettings& settings);

/// Concatenate frame bytes in order
std::vector<uint8_t> serialize_frames(const std::vector<CommandFrame>& frames);

/// Split a byte stream into chunks of at most `chunk_size` bytes
std::vector<std::vector<uint8_t>> make_chunks(const std::vector<uint8_t>& stream, size_t chunk_size);
