#pragma once
#include "spritebake/core/Errors.hpp"

#include <atomic>

/*
  Shared helpers for CLI modes: Ctrl+C handling and exit codes.
*/

/* Exit codes of spritebake-cli. */
enum ExitCode : int {
    kExitOk         = 0,
    kExitFailed     = 1,   // render, storage, encode or host failure
    kExitInvalid    = 2,   // bad options or job validation error
    kExitCancelled  = 3
};

/* Flag raised by SIGINT/SIGTERM once installInterruptHandler() ran. */
std::atomic<bool>& interruptFlag();
void installInterruptHandler();

/* Exit code for a failed export. */
int exitCodeFor(const spritebake::ExportError& e);
