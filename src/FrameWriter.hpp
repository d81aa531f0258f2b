#ifndef ANDES_FRAME_WRITER_HPP
#define ANDES_FRAME_WRITER_HPP

#include "Frame.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace andes {

// Saves frames as numbered lossless PNGs: <prefix>_<n>.png.
class FrameWriter {
public:
    explicit FrameWriter(const std::string& prefix);

    // Returns the file name written.
    std::string write(const Frame& frame);

    int frame_count() const { return count; }

    // 8-bit frames become CV_8UC1, everything else CV_16UC1 with the raw sample values.
    static cv::Mat to_mat(const Frame& frame);

private:
    std::string generate_filename() const;

    std::string prefix;
    int count = 0;
};

}

#endif
