#pragma once
#include "codebox/isolate_protocol.h"

#include <string>

namespace codebox {

// The isolate's end of the host connection: blocking NDJSON line I/O on two
// descriptors (the same socket in production, pipes when run by hand).
class HostChannel {
public:
    HostChannel(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

    // Blocks until a full line arrives. False on EOF, read error or a line
    // longer than kMaxProtocolLine.
    bool read_line(std::string* line);

    // Writes line + '\n' completely. False once the host is gone.
    bool write_line(const std::string& line);

private:
    int in_fd_;
    int out_fd_;
    LineBuffer buf_;
    bool lost_{false};
};

} // namespace codebox
