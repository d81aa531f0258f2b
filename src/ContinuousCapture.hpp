#ifndef ANDES_CONTINUOUS_CAPTURE_HPP
#define ANDES_CONTINUOUS_CAPTURE_HPP

#include "AcquisitionPipeline.hpp"
#include "FrameQueue.hpp"
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace andes {

// Repeats capture() on a background thread and hands the frames over through a FrameQueue.
// Any error ends the loop; it is kept for last_error().
class ContinuousCapture {
public:
    explicit ContinuousCapture(AcquisitionPipeline& pipeline, size_t queue_capacity = 4);
    ~ContinuousCapture();

    ContinuousCapture(const ContinuousCapture&) = delete;
    ContinuousCapture& operator=(const ContinuousCapture&) = delete;

    // max_frames == 0 runs until stop().
    void start(size_t max_frames = 0);
    // Requests cancellation and joins the capture thread.
    void stop();
    bool is_running() const;

    // Applied by the capture thread before its next exposure.
    void stage_config(const CameraConfig& config);

    FrameQueue& frames() { return queue; }
    size_t captured() const { return captured_count; }
    std::exception_ptr last_error() const;

private:
    void run(size_t max_frames);
    void apply_staged_config();

    AcquisitionPipeline& pipeline;
    FrameQueue queue;

    std::thread worker;
    std::atomic<bool> cancel{false};
    std::atomic<bool> running{false};
    std::atomic<size_t> captured_count{0};

    mutable std::mutex mutex;
    std::optional<CameraConfig> staged;
    std::exception_ptr error;
};

}

#endif
