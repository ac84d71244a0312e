#include "host_channel.h"

#include <cerrno>
#include <unistd.h>

namespace codebox {

bool HostChannel::read_line(std::string* line) {
    if (lost_) return false;
    while (true) {
        if (buf_.next_line(line)) return true;
        if (buf_.overflow()) {
            lost_ = true;
            return false;
        }
        char tmp[16384];
        ssize_t n = read(in_fd_, tmp, sizeof(tmp));
        if (n > 0) {
            buf_.append(tmp, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        lost_ = true;
        return false;
    }
}

bool HostChannel::write_line(const std::string& line) {
    if (lost_) return false;
    std::string data = line;
    data += '\n';
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(out_fd_, data.data() + off, data.size() - off);
        if (n > 0) {
            off += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        lost_ = true;
        return false;
    }
    return true;
}

} // namespace codebox
