#include "protocol.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static std::array<uint8_t, 256> make_crc8_table(uint8_t poly) {
    std::array<uint8_t, 256> table{};
    for (int i = 0; i < 256; i++) {
        uint8_t crc = (uint8_t)i;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x80) ? (uint8_t)((crc << 1) ^ poly) : (uint8_t)(crc << 1);
        }
        table[i] = crc;
    }
    return table;
}

// Built once during static initialization, read-only afterwards
static const std::array<uint8_t, 256> CRC8_TABLE = make_crc8_table(0x07);

// Lattice control payloads sent around the bitmap data
static const std::vector<uint8_t> LATTICE_START = {
    0xAA, 0x55, 0x17, 0x38, 0x44, 0x5F, 0x5F, 0x5F, 0x44, 0x38, 0x2C
};
static const std::vector<uint8_t> LATTICE_STOP = {
    0xAA, 0x55, 0x17, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x17
};

uint8_t crc8(const uint8_t* data, size_t len) {
    uint8_t crc = 0;
    for (size_t i = 0; i < len; i++) {
        crc = CRC8_TABLE[crc ^ data[i]];
    }
    return crc;
}

uint8_t crc8(const std::vector<uint8_t>& data) {
    return crc8(data.data(), data.size());
}

CommandFrame build_frame(Opcode opcode, const std::vector<uint8_t>& payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        std::ostringstream oss;
        oss << "Payload of " << payload.size() << " bytes for opcode 0x" << std::hex
            << (int)opcode << " exceeds the " << std::dec << MAX_PAYLOAD_SIZE << " byte limit";
        throw FrameTooLarge(oss.str());
    }

    CommandFrame frame;
    frame.opcode = opcode;
    frame.bytes.reserve(FRAME_HEADER_SIZE + payload.size() + 1);
    frame.bytes.push_back(FRAME_MAGIC_0);
    frame.bytes.push_back(FRAME_MAGIC_1);
    frame.bytes.push_back((uint8_t)opcode);
    frame.bytes.push_back((uint8_t)(payload.size() & 0xFF));
    frame.bytes.push_back((uint8_t)((payload.size() >> 8) & 0xFF));
    frame.bytes.insert(frame.bytes.end(), payload.begin(), payload.end());

    // Checksum covers everything after the preamble
    frame.bytes.push_back(crc8(frame.bytes.data() + 2, frame.bytes.size() - 2));
    return frame;
}

static std::vector<uint8_t> u16_le(uint16_t value) {
    return {(uint8_t)(value & 0xFF), (uint8_t)(value >> 8)};
}

CommandFrame build_energy_frame(uint16_t energy) {
    return build_frame(Opcode::Energy, u16_le(energy));
}

CommandFrame build_quality_frame(uint8_t quality) {
    return build_frame(Opcode::Quality, {std::clamp(quality, QUALITY_MIN, QUALITY_MAX)});
}

CommandFrame build_drawing_mode_frame(bool text) {
    return build_frame(Opcode::DrawingMode, {(uint8_t)(text ? 1 : 0)});
}

CommandFrame build_lattice_start_frame() {
    return build_frame(Opcode::Lattice, LATTICE_START);
}

CommandFrame build_lattice_stop_frame() {
    return build_frame(Opcode::Lattice, LATTICE_STOP);
}

CommandFrame build_bitmap_frame(const std::vector<uint8_t>& packed_rows) {
    return build_frame(Opcode::BitmapRows, packed_rows);
}

CommandFrame build_feed_frame(uint16_t lines) {
    return build_frame(Opcode::FeedPaper, u16_le(lines));
}

CommandFrame build_retract_frame(uint16_t lines) {
    return build_frame(Opcode::RetractPaper, u16_le(lines));
}

//--- Stream parser ---

std::vector<ParsedFrame> parse_frames(const std::vector<uint8_t>& stream) {
    std::vector<ParsedFrame> frames;
    size_t i = 0;
    while (i < stream.size()) {
        if (stream.size() - i < FRAME_HEADER_SIZE + 1) {
            throw std::runtime_error("Truncated frame header");
        }
        if (stream[i] != FRAME_MAGIC_0 || stream[i + 1] != FRAME_MAGIC_1) {
            std::ostringstream oss;
            oss << "Bad frame preamble at offset " << i;
            throw std::runtime_error(oss.str());
        }

        size_t len = stream[i + 3] | (stream[i + 4] << 8);
        size_t total = FRAME_HEADER_SIZE + len + 1;
        if (i + total > stream.size()) {
            throw std::runtime_error("Truncated frame payload");
        }

        uint8_t expected = crc8(stream.data() + i + 2, total - 3);
        uint8_t actual = stream[i + total - 1];
        if (expected != actual) {
            std::ostringstream oss;
            oss << "Checksum mismatch at offset " << i << ": expected 0x" << std::hex
                << std::setw(2) << std::setfill('0') << (int)expected << ", got 0x"
                << std::setw(2) << (int)actual;
            throw std::runtime_error(oss.str());
        }

        ParsedFrame frame;
        frame.opcode = stream[i + 2];
        frame.payload.assign(stream.begin() + i + FRAME_HEADER_SIZE,
                             stream.begin() + i + FRAME_HEADER_SIZE + len);
        frames.push_back(std::move(frame));
        i += total;
    }
    return frames;
}
