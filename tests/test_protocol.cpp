#include "errors.hpp"
#include "protocol.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <stdexcept>

TEST(Crc8, KnownValues) {
    const char* check = "123456789";
    EXPECT_EQ(crc8((const uint8_t*)check, std::strlen(check)), 0xF4);
    EXPECT_EQ(crc8(std::vector<uint8_t>{}), 0x00);
    EXPECT_EQ(crc8(std::vector<uint8_t>{0x01}), 0x07);
    EXPECT_EQ(crc8(std::vector<uint8_t>{0x80}), 0x89);
}

TEST(Crc8, DetectsEverySingleBitFlip) {
    std::vector<uint8_t> data = {0xA2, 0x30, 0x00, 0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0};
    uint8_t reference = crc8(data);
    for (size_t i = 0; i < data.size(); i++) {
        for (int bit = 0; bit < 8; bit++) {
            std::vector<uint8_t> flipped = data;
            flipped[i] ^= (uint8_t)(1 << bit);
            EXPECT_NE(crc8(flipped), reference) << "byte " << i << " bit " << bit;
        }
    }
}

TEST(Frame, Layout) {
    CommandFrame frame = build_frame(Opcode::Quality, {0x33});
    std::vector<uint8_t> expected = {0x51, 0x78, 0xA4, 0x01, 0x00, 0x33, 0x55};
    EXPECT_EQ(frame.bytes, expected);
    EXPECT_EQ(frame.opcode, Opcode::Quality);
    EXPECT_EQ(frame.payload_size(), 1u);
}

TEST(Frame, ChecksumCoversOpcodeLengthAndPayload) {
    std::vector<uint8_t> payload(48);
    for (size_t i = 0; i < payload.size(); i++) payload[i] = (uint8_t)(i * 37);
    CommandFrame frame = build_bitmap_frame(payload);

    ASSERT_EQ(frame.bytes.size(), FRAME_HEADER_SIZE + payload.size() + 1);
    std::vector<uint8_t> covered(frame.bytes.begin() + 2, frame.bytes.end() - 1);
    EXPECT_EQ(frame.bytes.back(), crc8(covered));
}

TEST(Frame, EmptyPayload) {
    CommandFrame frame = build_frame(Opcode::RetractPaper, {});
    ASSERT_EQ(frame.bytes.size(), FRAME_HEADER_SIZE + 1);
    EXPECT_EQ(frame.bytes[3], 0x00);
    EXPECT_EQ(frame.bytes[4], 0x00);
    EXPECT_EQ(frame.payload_size(), 0u);
}

TEST(Frame, PayloadLimit) {
    std::vector<uint8_t> largest(MAX_PAYLOAD_SIZE, 0xAB);
    CommandFrame frame = build_frame(Opcode::BitmapRows, largest);
    EXPECT_EQ(frame.bytes[3], 0xFF);
    EXPECT_EQ(frame.bytes[4], 0x00);
    EXPECT_EQ(frame.payload_size(), MAX_PAYLOAD_SIZE);

    std::vector<uint8_t> too_large(MAX_PAYLOAD_SIZE + 1, 0xAB);
    EXPECT_THROW(build_frame(Opcode::BitmapRows, too_large), FrameTooLarge);

    try {
        build_bitmap_frame(too_large);
        FAIL() << "oversized payload accepted";
    } catch (const PrintError& e) {
        EXPECT_EQ(e.kind(), PrintError::Kind::FrameTooLarge);
    }
}

TEST(Commands, Energy) {
    std::vector<uint8_t> expected = {0x51, 0x78, 0xAF, 0x02, 0x00, 0xE0, 0x2E, 0x66};
    EXPECT_EQ(build_energy_frame(12000).bytes, expected);
}

TEST(Commands, FeedIsLittleEndian) {
    std::vector<uint8_t> expected = {0x51, 0x78, 0xA1, 0x02, 0x00, 0x28, 0x00, 0xBB};
    EXPECT_EQ(build_feed_frame(40).bytes, expected);

    CommandFrame big = build_feed_frame(0x1234);
    EXPECT_EQ(big.bytes[5], 0x34);
    EXPECT_EQ(big.bytes[6], 0x12);

    EXPECT_EQ(build_retract_frame(40).bytes[2], 0xA0);
}

TEST(Commands, QualityIsClamped) {
    EXPECT_EQ(build_quality_frame(0x00).bytes[5], QUALITY_MIN);
    EXPECT_EQ(build_quality_frame(0x34).bytes[5], 0x34);
    EXPECT_EQ(build_quality_frame(0xFF).bytes[5], QUALITY_MAX);
}

TEST(Commands, DrawingMode) {
    std::vector<uint8_t> text = {0x51, 0x78, 0xBE, 0x01, 0x00, 0x01, 0x30};
    EXPECT_EQ(build_drawing_mode_frame(true).bytes, text);
    EXPECT_EQ(build_drawing_mode_frame(false).bytes[5], 0x00);
}

TEST(Commands, LatticeStartAndStopDiffer) {
    CommandFrame start = build_lattice_start_frame();
    CommandFrame stop = build_lattice_stop_frame();
    EXPECT_EQ(start.opcode, Opcode::Lattice);
    EXPECT_EQ(stop.opcode, Opcode::Lattice);
    EXPECT_EQ(start.payload_size(), 11u);
    EXPECT_EQ(stop.payload_size(), 11u);
    EXPECT_NE(start.bytes, stop.bytes);
}

// --- Stream parser ---

TEST(ParseFrames, RecoversFramesInOrder) {
    std::vector<uint8_t> stream;
    for (const auto& f : {build_energy_frame(8000), build_quality_frame(0x35),
                          build_bitmap_frame(std::vector<uint8_t>(48, 0x0F)), build_feed_frame(40)}) {
        stream.insert(stream.end(), f.bytes.begin(), f.bytes.end());
    }

    auto frames = parse_frames(stream);
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[0].opcode, 0xAF);
    EXPECT_EQ(frames[0].payload, (std::vector<uint8_t>{0x40, 0x1F}));
    EXPECT_EQ(frames[1].opcode, 0xA4);
    EXPECT_EQ(frames[2].opcode, 0xA2);
    EXPECT_EQ(frames[2].payload, std::vector<uint8_t>(48, 0x0F));
    EXPECT_EQ(frames[3].opcode, 0xA1);
}

TEST(ParseFrames, RejectsCorruption) {
    std::vector<uint8_t> good = build_bitmap_frame({0x01, 0x02, 0x03}).bytes;
    EXPECT_NO_THROW(parse_frames(good));

    std::vector<uint8_t> bad_crc = good;
    bad_crc[6] ^= 0x10;
    EXPECT_THROW(parse_frames(bad_crc), std::runtime_error);

    std::vector<uint8_t> bad_magic = good;
    bad_magic[0] = 0x50;
    EXPECT_THROW(parse_frames(bad_magic), std::runtime_error);

    std::vector<uint8_t> truncated(good.begin(), good.end() - 2);
    EXPECT_THROW(parse_frames(truncated), std::runtime_error);

    EXPECT_TRUE(parse_frames({}).empty());
}
