#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// Frame preamble bytes
static const uint8_t FRAME_MAGIC_0 = 0x51;
static const uint8_t FRAME_MAGIC_1 = 0x78;

/// preamble(2) + opcode(1) + length(2)
static const size_t FRAME_HEADER_SIZE = 5;

/// Largest payload a single command may carry
static const size_t MAX_PAYLOAD_SIZE = 0xFF;

/// Command opcodes understood by the printer
enum class Opcode : uint8_t {
    RetractPaper = 0xA0,
    FeedPaper    = 0xA1,
    BitmapRows   = 0xA2,
    Quality      = 0xA4,
    Lattice      = 0xA6,
    Energy       = 0xAF,
    DrawingMode  = 0xBE,
};

/// Quality byte range accepted by the printer
static const uint8_t QUALITY_MIN = 0x31;
static const uint8_t QUALITY_MAX = 0x35;
static const uint8_t QUALITY_DEFAULT = 0x33;

/// A framed command: 51 78 opcode len_lo len_hi payload... crc8
struct CommandFrame {
    Opcode opcode;
    std::vector<uint8_t> bytes;

    size_t payload_size() const { return bytes.size() - FRAME_HEADER_SIZE - 1; }
};

/// CRC-8 (polynomial 0x07, init 0x00)
uint8_t crc8(const uint8_t* data, size_t len);
uint8_t crc8(const std::vector<uint8_t>& data);

/// Frame an arbitrary payload. Throws FrameTooLarge above MAX_PAYLOAD_SIZE.
CommandFrame build_frame(Opcode opcode, const std::vector<uint8_t>& payload);

/// Print head energy (darkness)
CommandFrame build_energy_frame(uint16_t energy);

/// Print quality, clamped to QUALITY_MIN..QUALITY_MAX
CommandFrame build_quality_frame(uint8_t quality);

/// Drawing mode: text (true) or image (false)
CommandFrame build_drawing_mode_frame(bool text);

CommandFrame build_lattice_start_frame();
CommandFrame build_lattice_stop_frame();

/// One or more consecutive packed scanlines
CommandFrame build_bitmap_frame(const std::vector<uint8_t>& packed_rows);

CommandFrame build_feed_frame(uint16_t lines);
CommandFrame build_retract_frame(uint16_t lines);

/// Decoded view of one frame found in a byte stream
struct ParsedFrame {
    uint8_t opcode;
    std::vector<uint8_t> payload;
};

/// Split a byte stream into frames, validating preamble, length and checksum.
/// Throws std::runtime_error on malformed input.
std::vector<ParsedFrame> parse_frames(const std::vector<uint8_t>& stream);
