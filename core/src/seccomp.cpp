#include "codebox/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define CODEBOX_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define CODEBOX_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define CODEBOX_AUDIT_ARCH 0
#endif

namespace codebox {

namespace {

sock_filter bpf_stmt(unsigned short code, unsigned int k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter bpf_jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    return sock_filter{code, jt, jf, k};
}

std::vector<unsigned int> isolate_allowlist() {
    std::vector<unsigned int> v = {
        // descriptor I/O on the host channel and stderr
        __NR_read, __NR_write, __NR_readv, __NR_writev, __NR_close,
        __NR_lseek, __NR_fstat, __NR_fcntl, __NR_ppoll, __NR_pselect6,
        // heap
        __NR_munmap, __NR_mremap, __NR_brk, __NR_madvise,
        // threads and signals
        __NR_futex, __NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn,
        __NR_sigaltstack, __NR_getpid, __NR_gettid, __NR_tgkill,
        __NR_sched_yield, __NR_set_robust_list,
        // time and entropy
        __NR_clock_gettime, __NR_clock_getres, __NR_clock_nanosleep,
        __NR_gettimeofday, __NR_nanosleep, __NR_getrandom,
        // exit
        __NR_exit, __NR_exit_group,
    };
#ifdef __NR_poll
    v.push_back(__NR_poll);
#endif
#ifdef __NR_newfstatat
    v.push_back(__NR_newfstatat);
#endif
#ifdef __NR_rseq
    v.push_back(__NR_rseq);
#endif
    return v;
}

} // namespace

std::string install_isolate_seccomp_filter() {
#if CODEBOX_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    const std::vector<unsigned int> allow = isolate_allowlist();
    const size_t n = allow.size();
    const unsigned int deny = SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA);

    // [0]       load arch
    // [1]       arch ok -> skip kill
    // [2]       KILL
    // [3]       load nr
    // [4]       nr == mmap -> PROT
    // [5]       nr == mprotect -> PROT
    // [6..6+n)  nr == allow[s] -> ALLOW
    // [6+n]     DENY
    // [7+n]     PROT: load prot (arg2, low word; same slot for both calls)
    // [8+n]     PROT_EXEC set -> DENY2
    // [9+n]     ALLOW
    // [10+n]    DENY2
    std::vector<sock_filter> f;
    f.reserve(n + 11);

    f.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, CODEBOX_AUDIT_ARCH, 1, 0));
    f.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    // PROT is at 7+n: from [4] jt = n+2, from [5] jt = n+1
    f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_mmap, (unsigned char)(n + 2), 0));
    f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_mprotect, (unsigned char)(n + 1), 0));
    for (size_t s = 0; s < n; s++) {
        // from [6+s], ALLOW is at 9+n: jt = (9+n) - (6+s) - 1
        f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, allow[s], (unsigned char)(n + 2 - s), 0));
    }
    f.push_back(bpf_stmt(BPF_RET | BPF_K, deny));

    f.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS,
                         offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    f.push_back(bpf_jump(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 1, 0));
    f.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    f.push_back(bpf_stmt(BPF_RET | BPF_K, deny));

    if (n + 2 > 255) return "seccomp: allowlist too long for BPF jump offsets";

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return std::string("prctl(NO_NEW_PRIVS) failed: ") + std::strerror(errno);
    }

    struct sock_fprog prog = {};
    prog.len = (unsigned short)f.size();
    prog.filter = f.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and inactive, 2: filter mode active, -1/EINVAL: not built in
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return (ret >= 0);
}

} // namespace codebox

#else // !__linux__

namespace codebox {

std::string install_isolate_seccomp_filter() {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace codebox

#endif
