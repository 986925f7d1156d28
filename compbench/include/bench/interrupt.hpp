//! # Interrupt Handling
//!
//! SIGINT/SIGTERM must not leave a compiler running or a temp file behind.
//! The handler only records the request and kills the process group of the
//! child currently being waited on; the wait loop notices the flag and the
//! normal unwinding path (RAII guards, early returns) does the cleanup.

#pragma once

#include <sys/types.h>

namespace compbench::bench {

/// Installs the SIGINT and SIGTERM handlers and restores the default
/// SIGCHLD disposition. Safe to call more than once.
void install_interrupt_handlers();

/// True once SIGINT/SIGTERM arrived (or request_interrupt() was called).
bool interrupt_requested();

/// Same effect as receiving SIGINT, without the signal.
void request_interrupt();

/// Clears the interrupt flag. Intended for tests.
void reset_interrupt();

/// Registers the process group the signal handler should kill; 0 clears it.
void set_active_process_group(pid_t pgid);

} // namespace compbench::bench
