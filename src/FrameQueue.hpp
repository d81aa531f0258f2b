#ifndef ANDES_FRAME_QUEUE_HPP
#define ANDES_FRAME_QUEUE_HPP

#include "Frame.hpp"
#include <boost/circular_buffer.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace andes {

// Bounded hand-off between the capture thread and its consumer. A full queue drops
// its oldest frame so the producer never blocks.
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity);

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    void push(Frame&& frame);

    // Waits up to timeout for a frame. Empty when timed out, or closed and drained.
    std::optional<Frame> pop(std::chrono::milliseconds timeout);

    // Wakes waiting consumers; frames already queued can still be popped.
    void close();
    // Reopens a closed queue and discards leftovers.
    void reset();

    bool is_closed() const;
    size_t size() const;
    size_t capacity() const;
    size_t dropped() const;

private:
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    boost::circular_buffer<Frame> frames;
    size_t dropped_count = 0;
    bool closed = false;
};

}

#endif
