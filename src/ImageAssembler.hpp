#ifndef ANDES_IMAGE_ASSEMBLER_HPP
#define ANDES_IMAGE_ASSEMBLER_HPP

#include "Frame.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace andes {

namespace ImageAssembler {
    // Size of a raw frame on the wire. 12-bit samples are packed two per three bytes,
    // 16-bit samples are big-endian words.
    size_t expected_bytes(int width, int height, int bit_depth);

    // Concatenates chunks in the order they arrived and unpacks them.
    // Throws IncompleteFrame if the byte count does not match expected_bytes().
    Frame assemble(const std::vector<std::vector<uint8_t>>& chunks, int width, int height, int bit_depth,
                   const CameraConfig& config,
                   std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now());

    // Throws InvalidParameter for an unknown depth and IncompleteFrame when raw is too
    // short for sample_count samples.
    std::vector<uint16_t> unpack(const std::vector<uint8_t>& raw, size_t sample_count, int bit_depth);

    // Inverse of unpack(), the layout the controller streams.
    std::vector<uint8_t> pack(const std::vector<uint16_t>& samples, int bit_depth);
}

}

#endif
