#pragma once
#include "capability.h"
#include "types.h"

#include <string>

namespace codebox {

struct SandboxOptions {
    std::string isolate_bin;        // path to codebox_isolate
    size_t memory_limit_mb{128};    // JS heap ceiling
    size_t max_output_chars{10000}; // per stream (stdout / stderr)
    bool enable_seccomp{false};
    bool lazy_return{true};

    // Address-space headroom above the heap ceiling for the engine and libc.
    size_t process_overhead_mb{64};
};

// Runs one script snippet against a capability set. Implementations never
// throw: every failure is reported through RunResult::error.
class ISandbox {
public:
    virtual ~ISandbox() = default;
    virtual RunResult run(const std::string& code, const CapabilitySet& caps, int timeout_ms) = 0;
};

// One fresh codebox_isolate process per run.
//
// The process is the isolation boundary: capability arguments and results
// cross it as JSON text only. Capability calls execute on detached worker
// threads holding their own copy of the set, so a call still running when the
// run ends is abandoned and its result dropped. The deadline covers process
// start, bridge installation and execution; when it passes, the process group
// is killed.
class IsolateSandbox final : public ISandbox {
public:
    explicit IsolateSandbox(SandboxOptions opt);
    RunResult run(const std::string& code, const CapabilitySet& caps, int timeout_ms) override;

private:
    SandboxOptions opt_;
};

} // namespace codebox
