#pragma once

#include <atomic>

namespace live_asr {
namespace pipeline {

// Run-wide flags shared by every pipeline stage. Both only ever go false -> true,
// and only ShutdownCoordinator writes them.
struct PipelineFlags {
    std::atomic<bool> cancelled{false};
    std::atomic<bool> sessionClosed{false};

    bool isCancelled() const {
        return cancelled.load(std::memory_order_acquire);
    }
    bool isSessionClosed() const {
        return sessionClosed.load(std::memory_order_acquire);
    }
};

}  // namespace pipeline
}  // namespace live_asr
