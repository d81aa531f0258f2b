#include <gtest/gtest.h>

#include "CameraErrors.hpp"
#include "ImageAssembler.hpp"

#include <algorithm>

using namespace andes;

namespace {

std::vector<uint16_t> ramp(size_t count, uint16_t mask) {
    std::vector<uint16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = (uint16_t) ((i * 2654435761u >> 7) & mask);
    }
    return samples;
}

std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t>& raw, size_t pieces) {
    std::vector<std::vector<uint8_t>> chunks;
    size_t step = (raw.size() + pieces - 1) / pieces;
    for (size_t i = 0; i < raw.size(); i += step) {
        size_t end = std::min(raw.size(), i + step);
        chunks.emplace_back(raw.begin() + i, raw.begin() + end);
    }
    return chunks;
}

}

TEST(ImageAssemblerTest, ExpectedBytes_PerDepth) {
    EXPECT_EQ(ImageAssembler::expected_bytes(4, 3, 8), 12u);
    EXPECT_EQ(ImageAssembler::expected_bytes(4, 3, 12), 18u);
    EXPECT_EQ(ImageAssembler::expected_bytes(3, 1, 12), 5u);
    EXPECT_EQ(ImageAssembler::expected_bytes(4, 3, 16), 24u);
    EXPECT_EQ(ImageAssembler::expected_bytes(2048, 2064, 16), 2048u * 2064u * 2u);
}

TEST(ImageAssemblerTest, ExpectedBytes_RejectsUnknownDepth) {
    EXPECT_THROW(ImageAssembler::expected_bytes(4, 4, 10), InvalidParameter);
    EXPECT_THROW(ImageAssembler::expected_bytes(4, 4, 14), InvalidParameter);
}

TEST(ImageAssemblerTest, Unpack16_IsBigEndian) {
    std::vector<uint16_t> samples = ImageAssembler::unpack({0x12, 0x34, 0xAB, 0xCD}, 2, 16);
    EXPECT_EQ(samples, (std::vector<uint16_t>{0x1234, 0xABCD}));
}

TEST(ImageAssemblerTest, Unpack12_NibbleLayout) {
    // AAAAAAAA AAAABBBB BBBBBBBB
    std::vector<uint16_t> samples = ImageAssembler::unpack({0xAB, 0xC1, 0x23}, 2, 12);
    EXPECT_EQ(samples, (std::vector<uint16_t>{0xABC, 0x123}));
}

TEST(ImageAssemblerTest, Unpack_ShortBufferIsIncomplete) {
    EXPECT_THROW(ImageAssembler::unpack({0x12, 0x34, 0xAB}, 2, 16), IncompleteFrame);
    EXPECT_THROW(ImageAssembler::unpack({0xAB, 0xC1}, 2, 12), IncompleteFrame);
    EXPECT_THROW(ImageAssembler::unpack({}, 1, 8), IncompleteFrame);
    // Three samples at 12 bits need five bytes, the last nibble is padding.
    EXPECT_EQ(ImageAssembler::unpack({0xAB, 0xC1, 0x23, 0x45, 0x60}, 3, 12).size(), 3u);
}

TEST(ImageAssemblerTest, Unpack_RejectsUnknownDepth) {
    EXPECT_THROW(ImageAssembler::unpack({0x00, 0x00, 0x00, 0x00}, 1, 10), InvalidParameter);
}

TEST(ImageAssemblerTest, Pack12_RoundTripsExactly) {
    for (size_t count : {1u, 2u, 7u, 1000u}) {
        std::vector<uint16_t> samples = ramp(count, 0x0FFF);
        std::vector<uint8_t> raw = ImageAssembler::pack(samples, 12);
        ASSERT_EQ(raw.size(), ImageAssembler::expected_bytes((int) count, 1, 12));
        EXPECT_EQ(ImageAssembler::unpack(raw, count, 12), samples) << count << " samples";
    }
}

TEST(ImageAssemblerTest, Assemble_ChunkingIsTransparent) {
    const int width = 37;
    const int height = 11;
    CameraConfig config;

    for (int depth : {8, 12, 16}) {
        std::vector<uint16_t> samples = ramp((size_t) width * height, (uint16_t) ((1u << depth) - 1));
        std::vector<uint8_t> raw = ImageAssembler::pack(samples, depth);

        Frame one = ImageAssembler::assemble({raw}, width, height, depth, config);
        Frame two = ImageAssembler::assemble(split(raw, 2), width, height, depth, config);
        Frame many = ImageAssembler::assemble(split(raw, 97), width, height, depth, config);

        EXPECT_EQ(one.pixels(), samples) << depth << " bit";
        EXPECT_EQ(two.pixels(), one.pixels()) << depth << " bit";
        EXPECT_EQ(many.pixels(), one.pixels()) << depth << " bit";
        EXPECT_EQ(many.width(), width);
        EXPECT_EQ(many.height(), height);
        EXPECT_EQ(many.bit_depth(), depth);
    }
}

TEST(ImageAssemblerTest, Assemble_ShortDataIsIncomplete) {
    std::vector<uint8_t> raw(4 * 4 * 2 - 3, 0);
    try {
        ImageAssembler::assemble({raw}, 4, 4, 16, CameraConfig());
        FAIL() << "expected IncompleteFrame";
    } catch (const IncompleteFrame& e) {
        EXPECT_EQ(e.expected(), 32u);
        EXPECT_EQ(e.received(), 29u);
    }
}

TEST(ImageAssemblerTest, Assemble_ExtraDataIsRejected) {
    std::vector<uint8_t> raw(4 * 4 * 2 + 2, 0);
    EXPECT_THROW(ImageAssembler::assemble({raw}, 4, 4, 16, CameraConfig()), IncompleteFrame);
}

TEST(ImageAssemblerTest, Frame_KeepsConfigAndTimestamp) {
    CameraConfig config;
    config.set_gain(4);
    auto when = std::chrono::system_clock::now() - std::chrono::seconds(5);
    std::vector<uint8_t> raw(2 * 2 * 2, 0x01);

    Frame frame = ImageAssembler::assemble({raw}, 2, 2, 16, config, when);
    EXPECT_EQ(frame.timestamp(), when);
    EXPECT_EQ(frame.config().gain(), 4);
    EXPECT_EQ(frame.at(1, 1), 0x0101);
}
