#pragma once

#include "pipeline/bounded_channel.h"
#include "pipeline/pipeline_flags.h"
#include "session/transcription_session.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace live_asr {
namespace pipeline {

struct ChunkPumpStats {
    std::uint64_t sizeFlushes = 0;
    std::uint64_t timeFlushes = 0;
    std::uint64_t finalFlushes = 0;
    std::uint64_t bytesSent = 0;
    std::uint64_t framesReceived = 0;
};

/**
 * @brief Re-chunks captured frames for the wire.
 *
 * Frames are appended to an accumulation buffer. A chunk of exactly chunkSizeBytes is
 * sent whenever the buffer holds that much; a partial buffer is sent whole once the
 * flush deadline passes. On exit, any remainder is sent once unless the session is
 * already closed. Send failures propagate as TransportError.
 */
class ChunkPump {
   public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    ChunkPump(BoundedChannel& channel, session::TranscriptionSession& session,
              PipelineFlags& flags, std::size_t chunkSizeBytes,
              std::chrono::milliseconds chunkDuration, ClockFn clock = &Clock::now);

    ChunkPump(const ChunkPump&) = delete;
    ChunkPump& operator=(const ChunkPump&) = delete;

    void run();

    ChunkPumpStats stats() const;

    // Bytes currently held in the accumulation buffer
    std::size_t bufferedBytes() const {
        return buffered_.load(std::memory_order_acquire);
    }

   private:
    void send(const std::vector<std::uint8_t>& chunk);

    BoundedChannel& channel_;
    session::TranscriptionSession& session_;
    PipelineFlags& flags_;
    const std::size_t chunkSizeBytes_;
    const std::chrono::milliseconds chunkDuration_;
    ClockFn clock_;

    std::vector<std::uint8_t> buffer_;
    std::atomic<std::size_t> buffered_{0};
    std::atomic<std::uint64_t> sizeFlushes_{0};
    std::atomic<std::uint64_t> timeFlushes_{0};
    std::atomic<std::uint64_t> finalFlushes_{0};
    std::atomic<std::uint64_t> bytesSent_{0};
    std::atomic<std::uint64_t> framesReceived_{0};
};

}  // namespace pipeline
}  // namespace live_asr
