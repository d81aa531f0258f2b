#include "FrameWriter.hpp"
#include "Log.hpp"
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

namespace andes {

FrameWriter::FrameWriter(const std::string& prefix) : prefix(prefix) {}

cv::Mat FrameWriter::to_mat(const Frame& frame) {
    const std::vector<uint16_t>& pixels = frame.pixels();

    if (frame.bit_depth() == 8) {
        cv::Mat mat(frame.height(), frame.width(), CV_8UC1);
        for (int y = 0; y < frame.height(); ++y) {
            uint8_t* row = mat.ptr<uint8_t>(y);
            for (int x = 0; x < frame.width(); ++x) {
                row[x] = (uint8_t) pixels[(size_t) y * frame.width() + x];
            }
        }
        return mat;
    }

    // Wrap the pixel buffer, then clone so the Mat owns its data.
    cv::Mat view(frame.height(), frame.width(), CV_16UC1, const_cast<uint16_t*>(pixels.data()));
    return view.clone();
}

std::string FrameWriter::generate_filename() const {
    return prefix + "_" + std::to_string(count) + ".png";
}

std::string FrameWriter::write(const Frame& frame) {
    std::string filename = generate_filename();
    cv::Mat mat = to_mat(frame);

    if (!cv::imwrite(filename, mat)) {
        throw std::runtime_error("Could not write " + filename);
    }
    ++count;
    dprintf("FrameWriter::write() - Saved %dx%d frame to %s\n", frame.width(), frame.height(), filename.c_str());
    return filename;
}

}
