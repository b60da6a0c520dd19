#pragma once

#include <csignal>

namespace live_asr {
namespace signals {

// Flags written by the signal handler and polled by the supervisor loop.
// volatile sig_atomic_t keeps the handler async-signal-safe.
struct SignalState {
    volatile sig_atomic_t interrupt = 0;  // SIGINT, SIGTERM
    volatile sig_atomic_t received = 0;   // last signal number (for logging)

    void reset() {
        interrupt = 0;
        received = 0;
    }
};

// Async-signal-safe handler that only sets flags on the global state
void signalHandler(int sig);

SignalState& getGlobalSignalState();

/**
 * @brief RAII registration of SIGINT/SIGTERM handlers.
 *
 * install() saves the previous dispositions and routes both signals to
 * signalHandler(); release() restores them. release() is idempotent and is also
 * run by the destructor.
 */
class InterruptRegistration {
   public:
    InterruptRegistration() = default;
    ~InterruptRegistration();

    InterruptRegistration(const InterruptRegistration&) = delete;
    InterruptRegistration& operator=(const InterruptRegistration&) = delete;

    bool install();
    void release();

    bool installed() const {
        return installed_;
    }

   private:
    bool installed_ = false;
    struct sigaction previousInt_ {};
    struct sigaction previousTerm_ {};
};

// Consume a pending interrupt. Returns the signal number, or 0 if none is pending.
int takePendingInterrupt(SignalState& state);

}  // namespace signals
}  // namespace live_asr
