#include "utils.hpp"

#include <csignal>

namespace {
std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}
} // namespace

std::atomic<bool>& interruptFlag() { return g_interrupted; }

/*
  Ctrl+C only raises the flag. The export stops between two frames and
  runs its normal cleanup, the render host shuts down from the main thread.
*/
void installInterruptHandler() {
    std::signal(SIGINT,  onInterrupt);
    std::signal(SIGTERM, onInterrupt);
}

int exitCodeFor(const spritebake::ExportError& e) {
    if (e.code() == spritebake::ErrorCode::Cancelled) return kExitCancelled;
    if (e.isValidationError())                         return kExitInvalid;
    return kExitFailed;
}
