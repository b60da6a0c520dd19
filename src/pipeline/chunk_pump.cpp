#include "pipeline/chunk_pump.h"

#include "logging/logger.h"

#include <iterator>

namespace live_asr {
namespace pipeline {

ChunkPump::ChunkPump(BoundedChannel& channel, session::TranscriptionSession& session,
                     PipelineFlags& flags, std::size_t chunkSizeBytes,
                     std::chrono::milliseconds chunkDuration, ClockFn clock)
    : channel_(channel),
      session_(session),
      flags_(flags),
      chunkSizeBytes_(chunkSizeBytes == 0 ? 1 : chunkSizeBytes),
      chunkDuration_(chunkDuration),
      clock_(std::move(clock)) {
    buffer_.reserve(chunkSizeBytes_ * 2);
}

void ChunkPump::send(const std::vector<std::uint8_t>& chunk) {
    session_.sendBytes(chunk);
    bytesSent_.fetch_add(chunk.size(), std::memory_order_relaxed);
}

void ChunkPump::run() {
    LOG_DEBUG("[ChunkPump] started: chunk={} bytes interval={}ms", chunkSizeBytes_,
              chunkDuration_.count());

    auto nextFlushDeadline = clock_() + chunkDuration_;

    while (!flags_.isCancelled() && !flags_.isSessionClosed()) {
        if (auto frame = channel_.popFor(chunkDuration_)) {
            buffer_.insert(buffer_.end(), frame->begin(), frame->end());
            framesReceived_.fetch_add(1, std::memory_order_relaxed);
            buffered_.store(buffer_.size(), std::memory_order_release);
        }

        while (buffer_.size() >= chunkSizeBytes_ && !flags_.isSessionClosed()) {
            const auto split = buffer_.begin() + static_cast<std::ptrdiff_t>(chunkSizeBytes_);
            std::vector<std::uint8_t> chunk(buffer_.begin(), split);
            buffer_.erase(buffer_.begin(), split);
            buffered_.store(buffer_.size(), std::memory_order_release);
            send(chunk);
            sizeFlushes_.fetch_add(1, std::memory_order_relaxed);
        }

        const auto now = clock_();
        if (!buffer_.empty() && !flags_.isSessionClosed() && now >= nextFlushDeadline) {
            std::vector<std::uint8_t> chunk;
            chunk.swap(buffer_);
            buffered_.store(0, std::memory_order_release);
            send(chunk);
            timeFlushes_.fetch_add(1, std::memory_order_relaxed);
            nextFlushDeadline = now + chunkDuration_;
        }
    }

    if (!buffer_.empty() && !flags_.isSessionClosed()) {
        std::vector<std::uint8_t> chunk;
        chunk.swap(buffer_);
        buffered_.store(0, std::memory_order_release);
        send(chunk);
        finalFlushes_.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("[ChunkPump] flushed {} bytes before stop", chunk.size());
    } else if (!buffer_.empty()) {
        LOG_DEBUG("[ChunkPump] session closed, discarding {} buffered bytes", buffer_.size());
    }

    const auto summary = stats();
    LOG_INFO("[ChunkPump] exit: {} bytes sent (size={} time={} final={})", summary.bytesSent,
             summary.sizeFlushes, summary.timeFlushes, summary.finalFlushes);
}

ChunkPumpStats ChunkPump::stats() const {
    ChunkPumpStats out;
    out.sizeFlushes = sizeFlushes_.load(std::memory_order_relaxed);
    out.timeFlushes = timeFlushes_.load(std::memory_order_relaxed);
    out.finalFlushes = finalFlushes_.load(std::memory_order_relaxed);
    out.bytesSent = bytesSent_.load(std::memory_order_relaxed);
    out.framesReceived = framesReceived_.load(std::memory_order_relaxed);
    return out;
}

}  // namespace pipeline
}  // namespace live_asr
