#include "core/interrupt_signal.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>

namespace live_asr {
namespace signals {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Async-signal-safe signal handler - ONLY sets flags
void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.interrupt = 1;
}

int takePendingInterrupt(SignalState& state) {
    if (!state.interrupt) {
        return 0;
    }
    state.interrupt = 0;
    return state.received;
}

InterruptRegistration::~InterruptRegistration() {
    release();
}

bool InterruptRegistration::install() {
    if (installed_) {
        return true;
    }

    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, &previousInt_) != 0) {
        LOG_ERROR("[Signals] Failed to install SIGINT handler: {}", std::strerror(errno));
        return false;
    }
    if (sigaction(SIGTERM, &action, &previousTerm_) != 0) {
        LOG_ERROR("[Signals] Failed to install SIGTERM handler: {}", std::strerror(errno));
        sigaction(SIGINT, &previousInt_, nullptr);
        return false;
    }
    installed_ = true;
    LOG_DEBUG("[Signals] SIGINT/SIGTERM handlers installed");
    return true;
}

void InterruptRegistration::release() {
    if (!installed_) {
        return;
    }
    if (sigaction(SIGINT, &previousInt_, nullptr) != 0) {
        LOG_WARN("[Signals] Failed to restore SIGINT handler: {}", std::strerror(errno));
    }
    if (sigaction(SIGTERM, &previousTerm_, nullptr) != 0) {
        LOG_WARN("[Signals] Failed to restore SIGTERM handler: {}", std::strerror(errno));
    }
    installed_ = false;
    LOG_DEBUG("[Signals] Previous signal handlers restored");
}

}  // namespace signals
}  // namespace live_asr
