#ifndef ANDES_FRAME_HPP
#define ANDES_FRAME_HPP

#include "CameraConfig.hpp"
#include <chrono>
#include <utility>
#include <cstdint>
#include <vector>

namespace andes {

// One acquired image. Built once by the ImageAssembler and never modified afterwards.
class Frame {
public:
    Frame(std::vector<uint16_t>&& pixels, int width, int height, int bit_depth,
          std::chrono::system_clock::time_point timestamp, const CameraConfig& config)
        : pixel_data(std::move(pixels)), frame_width(width), frame_height(height), depth(bit_depth),
          captured_at(timestamp), used_config(config) {}

    // Row-major, one sample per pixel.
    const std::vector<uint16_t>& pixels() const { return pixel_data; }
    int width() const { return frame_width; }
    int height() const { return frame_height; }
    int bit_depth() const { return depth; }
    std::chrono::system_clock::time_point timestamp() const { return captured_at; }
    const CameraConfig& config() const { return used_config; }

    uint16_t at(int x, int y) const { return pixel_data[(size_t) y * frame_width + x]; }

private:
    std::vector<uint16_t> pixel_data;
    int frame_width;
    int frame_height;
    int depth;
    std::chrono::system_clock::time_point captured_at;
    CameraConfig used_config;
};

}

#endif
