#include "ContinuousCapture.hpp"
#include "CameraErrors.hpp"
#include "Log.hpp"

namespace andes {

ContinuousCapture::ContinuousCapture(AcquisitionPipeline& pipeline, size_t queue_capacity)
    : pipeline(pipeline), queue(queue_capacity) {
}

ContinuousCapture::~ContinuousCapture() {
    stop();
}

void ContinuousCapture::start(size_t max_frames) {
    if (running) {
        throw DeviceBusy("continuous capture running");
    }
    if (worker.joinable()) {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        error = nullptr;
    }
    queue.reset();
    cancel = false;
    captured_count = 0;
    running = true;

    dprintf("ContinuousCapture::start() - Starting%s\n", max_frames ? "" : " until stopped");
    worker = std::thread(&ContinuousCapture::run, this, max_frames);
}

void ContinuousCapture::stop() {
    cancel = true;
    if (worker.joinable()) {
        worker.join();
        dprintf("ContinuousCapture::stop() - Stopped after %zu frame(s)\n", captured_count.load());
    }
}

bool ContinuousCapture::is_running() const {
    return running;
}

void ContinuousCapture::stage_config(const CameraConfig& config) {
    std::lock_guard<std::mutex> lock(mutex);
    staged = config;
}

std::exception_ptr ContinuousCapture::last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return error;
}

void ContinuousCapture::apply_staged_config() {
    std::optional<CameraConfig> next;
    {
        std::lock_guard<std::mutex> lock(mutex);
        next.swap(staged);
    }
    if (next) {
        pipeline.configure(*next);
    }
}

void ContinuousCapture::run(size_t max_frames) {
    try {
        while (!cancel) {
            apply_staged_config();
            queue.push(pipeline.capture(&cancel));
            ++captured_count;
            if (max_frames && captured_count >= max_frames) {
                break;
            }
        }
    } catch (const CaptureCancelled&) {
        dprintf("ContinuousCapture::run() - Cancelled\n");
    } catch (const std::exception& e) {
        dprintf("ContinuousCapture::run() - Stopping on error: %s\n", e.what());
        std::lock_guard<std::mutex> lock(mutex);
        error = std::current_exception();
    }
    running = false;
    queue.close();
}

}
