#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace live_asr {
namespace pipeline {

using Frame = std::vector<std::uint8_t>;

/**
 * @brief Fixed-capacity frame queue with drop-oldest overflow.
 *
 * push() runs on the capture thread and never waits on the consumer: the mutex is
 * held only for O(1) deque operations. When the queue is full the oldest frame is
 * evicted and the insert retried once.
 */
class BoundedChannel {
   public:
    static constexpr std::uint64_t kDropWarnInterval = 10;

    explicit BoundedChannel(std::size_t capacity);

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Empty frames are ignored
    void push(Frame frame);

    /**
     * @brief Wait up to timeout for the next frame.
     *
     * @return the oldest frame, or std::nullopt on timeout or after wakeAll()
     */
    std::optional<Frame> popFor(std::chrono::milliseconds timeout);

    // Release every waiter in popFor(); subsequent waits return immediately when empty
    void wakeAll();

    std::size_t size() const;
    std::size_t capacity() const {
        return capacity_;
    }
    std::uint64_t dropCount() const;
    std::uint64_t pushedCount() const;

   private:
    bool tryInsertLocked(Frame& frame);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> queue_;
    std::uint64_t drops_ = 0;
    std::uint64_t pushed_ = 0;
    bool woken_ = false;
};

}  // namespace pipeline
}  // namespace live_asr
