/**
 * @file line_reader.cpp
 * @brief Newline framing over a file descriptor.
 */

#include <ut803/line_reader.hpp>

#include <cerrno>
#include <chrono>

#include <poll.h>
#include <unistd.h>

namespace ut803 {

bool LineReader::take_line(std::string& line) {
    std::size_t pos = pending_.find('\n');
    if (pos != std::string::npos) {
        line.assign(pending_, 0, pos + 1);
        pending_.erase(0, pos + 1);
        return true;
    }
    if (pending_.size() >= MAX_LINE_LENGTH) {
        line.swap(pending_);
        pending_.clear();
        return true;
    }
    return false;
}

Error LineReader::read_line(std::string& line, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    if (fd_ < 0) {
        last_errno_ = EBADF;
        return Error::Io;
    }

    // Timeout is only reported once a poll at or past the deadline found
    // nothing to read, so a zero timeout still drains buffered input.
    bool drained = false;

    for (;;) {
        if (take_line(line)) {
            return Error::Ok;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() <= 0) {
                if (drained) {
                    line.swap(pending_);
                    pending_.clear();
                    return Error::Timeout;
                }
                wait_ms = 0;
            } else {
                wait_ms = static_cast<int>(remaining.count());
            }
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                return Error::Interrupted;
            }
            last_errno_ = errno;
            return Error::Io;
        }
        if (ready == 0) {
            drained = true;
            continue;
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            last_errno_ = EIO;
            return Error::Io;
        }

        char buf[64];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                return Error::Interrupted;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                drained = true;
                continue;
            }
            last_errno_ = errno;
            return Error::Io;
        }
        if (n == 0) {
            // Device gone (USB adapter unplugged) or pipe closed
            last_errno_ = 0;
            return Error::Io;
        }
        pending_.append(buf, static_cast<std::size_t>(n));
        drained = false;
    }
}

} // namespace ut803
