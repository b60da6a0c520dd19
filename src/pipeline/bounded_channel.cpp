#include "pipeline/bounded_channel.h"

#include "core/error_codes.h"
#include "logging/logger.h"

namespace live_asr {
namespace pipeline {

BoundedChannel::BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool BoundedChannel::tryInsertLocked(Frame& frame) {
    if (queue_.size() >= capacity_) {
        return false;
    }
    queue_.push_back(std::move(frame));
    ++pushed_;
    return true;
}

void BoundedChannel::push(Frame frame) {
    if (frame.empty()) {
        return;
    }

    std::uint64_t drops = 0;
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = tryInsertLocked(frame);
        if (!inserted) {
            drops = ++drops_;
            if (!queue_.empty()) {
                queue_.pop_front();
            }
            inserted = tryInsertLocked(frame);
        }
    }
    if (inserted) {
        cv_.notify_one();
    }

    if (drops != 0 && drops % kDropWarnInterval == 0) {
        LOG_WARN("[BoundedChannel] {}: queue full (capacity {}), dropped {} oldest frames so far",
                 errorCodeToString(ErrorCode::CAPTURE_QUEUE_OVERFLOW), capacity_, drops);
    }
}

std::optional<Frame> BoundedChannel::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || woken_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(queue_.front());
    queue_.pop_front();
    return frame;
}

void BoundedChannel::wakeAll() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

std::size_t BoundedChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t BoundedChannel::dropCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drops_;
}

std::uint64_t BoundedChannel::pushedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
}

}  // namespace pipeline
}  // namespace live_asr
