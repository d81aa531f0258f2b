#include "FrameQueue.hpp"
#include "Log.hpp"
#include <stdexcept>
#include <utility>

namespace andes {

FrameQueue::FrameQueue(size_t capacity) : frames(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("FrameQueue capacity must be at least 1");
    }
}

void FrameQueue::push(Frame&& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (frames.full()) {
            ++dropped_count;
            verbose_printf("FrameQueue::push() - Queue full, dropping oldest frame (%zu dropped)\n", dropped_count);
        }
        frames.push_back(std::move(frame));
    }
    not_empty.notify_one();
}

std::optional<Frame> FrameQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    not_empty.wait_for(lock, timeout, [this]() { return !frames.empty() || closed; });
    if (frames.empty()) {
        return std::nullopt;
    }
    std::optional<Frame> frame(std::move(frames.front()));
    frames.pop_front();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    not_empty.notify_all();
}

void FrameQueue::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    frames.clear();
    dropped_count = 0;
    closed = false;
}

bool FrameQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return frames.size();
}

size_t FrameQueue::capacity() const {
    return frames.capacity();
}

size_t FrameQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dropped_count;
}

}
