#include "ImageAssembler.hpp"
#include "CameraErrors.hpp"

namespace andes {

namespace ImageAssembler {

static void check_bit_depth(int bit_depth) {
    if (bit_depth != 8 && bit_depth != 12 && bit_depth != 16) {
        throw InvalidParameter("bit_depth", bit_depth, "one of 8, 12, 16");
    }
}

static size_t packed_size(size_t samples, int bit_depth) {
    switch (bit_depth) {
        case 8: return samples;
        case 12: return (samples * 3 + 1) / 2;
        default: return samples * 2;
    }
}

size_t expected_bytes(int width, int height, int bit_depth) {
    check_bit_depth(bit_depth);
    return packed_size((size_t) width * (size_t) height, bit_depth);
}

std::vector<uint16_t> unpack(const std::vector<uint8_t>& raw, size_t sample_count, int bit_depth) {
    check_bit_depth(bit_depth);
    size_t needed = packed_size(sample_count, bit_depth);
    if (raw.size() < needed) {
        throw IncompleteFrame(needed, raw.size());
    }
    std::vector<uint16_t> samples(sample_count);

    if (bit_depth == 8) {
        for (size_t i = 0; i < sample_count; ++i) {
            samples[i] = raw[i];
        }
    } else if (bit_depth == 12) {
        // AAAAAAAA AAAABBBB BBBBBBBB
        size_t j = 0;
        for (size_t i = 0; i < sample_count; i += 2, j += 3) {
            samples[i] = (uint16_t) ((raw[j] << 4) | (raw[j + 1] >> 4));
            if (i + 1 < sample_count) {
                samples[i + 1] = (uint16_t) (((raw[j + 1] & 0x0F) << 8) | raw[j + 2]);
            }
        }
    } else {
        for (size_t i = 0; i < sample_count; ++i) {
            samples[i] = (uint16_t) ((raw[2 * i] << 8) | raw[2 * i + 1]);
        }
    }
    return samples;
}

std::vector<uint8_t> pack(const std::vector<uint16_t>& samples, int bit_depth) {
    check_bit_depth(bit_depth);
    std::vector<uint8_t> raw;
    raw.reserve(packed_size(samples.size(), bit_depth));

    if (bit_depth == 8) {
        for (uint16_t s : samples) {
            raw.push_back((uint8_t) (s & 0xFF));
        }
    } else if (bit_depth == 12) {
        for (size_t i = 0; i < samples.size(); i += 2) {
            uint16_t a = samples[i] & 0x0FFF;
            raw.push_back((uint8_t) (a >> 4));
            if (i + 1 < samples.size()) {
                uint16_t b = samples[i + 1] & 0x0FFF;
                raw.push_back((uint8_t) (((a & 0x0F) << 4) | (b >> 8)));
                raw.push_back((uint8_t) (b & 0xFF));
            } else {
                raw.push_back((uint8_t) ((a & 0x0F) << 4));
            }
        }
    } else {
        for (uint16_t s : samples) {
            raw.push_back((uint8_t) (s >> 8));
            raw.push_back((uint8_t) (s & 0xFF));
        }
    }
    return raw;
}

Frame assemble(const std::vector<std::vector<uint8_t>>& chunks, int width, int height, int bit_depth,
               const CameraConfig& config, std::chrono::system_clock::time_point timestamp) {
    size_t expected = expected_bytes(width, height, bit_depth);

    size_t received = 0;
    for (const auto& chunk : chunks) {
        received += chunk.size();
    }
    if (received != expected) {
        throw IncompleteFrame(expected, received);
    }

    std::vector<uint8_t> raw;
    raw.reserve(expected);
    for (const auto& chunk : chunks) {
        raw.insert(raw.end(), chunk.begin(), chunk.end());
    }

    return Frame(unpack(raw, (size_t) width * (size_t) height, bit_depth), width, height, bit_depth, timestamp, config);
}

}

}
