#pragma once

// seccomp-BPF allowlist for the script isolate process.
//
// The isolate only computes and talks to its host over already-open
// descriptors, so the list is short: fd I/O, memory management, futexes,
// signals, clocks and exit. Everything else fails with EPERM, so an engine
// that tries an optional syscall degrades instead of dying. mmap and mprotect
// with PROT_EXEC are denied the same way. An architecture mismatch kills the
// process.
//
// Supports x86_64 and aarch64.

#include <string>

namespace codebox {

// Install the filter on the calling thread (and threads it creates later).
// Sets PR_SET_NO_NEW_PRIVS first. Returns empty string on success, error
// message on failure. On non-Linux platforms, returns success (no-op).
std::string install_isolate_seccomp_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace codebox
