#include "host_channel.h"
#include "script_isolate.h"

#include "codebox/isolate_protocol.h"
#include "codebox/log.h"
#include "codebox/seccomp.h"

#include <csignal>
#include <cstdlib>
#include <string>

#include <unistd.h>

using namespace codebox;

// codebox_isolate: runs exactly one script per process.
//
// Reads one IsolateRequest line from stdin, installs the bridge, optionally
// locks itself down with seccomp, then runs the script and answers capability
// calls through the host over stdin/stdout. Ends with a single "done" line.
int main() {
    std::signal(SIGPIPE, SIG_IGN);
    if (const char* lv = std::getenv("CODEBOX_LOG_LEVEL")) set_log_level(log_level_from_string(lv));

    HostChannel chan(STDIN_FILENO, STDOUT_FILENO);

    std::string line;
    if (!chan.read_line(&line)) {
        log_error("isolate: no request from host");
        return 2;
    }

    IsolateRequest req;
    std::string err;
    if (!decode_request(line, &req, &err)) {
        (void)chan.write_line(encode_done_error(err, kFailProtocol));
        return 2;
    }

    int rc = 0;
    {
        ScriptIsolate iso(chan, req.memory_limit_mb, req.timeout_ms);
        if (!iso.install(req.capabilities, &err)) {
            (void)chan.write_line(encode_done_error(err, kFailInternal));
            return 1;
        }

        if (req.seccomp) {
            std::string serr = install_isolate_seccomp_filter();
            if (!serr.empty()) {
                (void)chan.write_line(encode_done_error(serr, kFailInternal));
                return 1;
            }
        }

        if (!chan.write_line(encode_ready())) return 3;

        ScriptIsolate::Outcome out = iso.run(req.code);
        bool sent = chan.write_line(out.ok ? encode_done_ok(out.value_json)
                                           : encode_done_error(out.error, out.kind));
        if (!sent) rc = 3;
    }
    return rc;
}
