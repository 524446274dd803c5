/**
 * @file line_reader.hpp
 * @brief Newline framing over a file descriptor.
 */

#ifndef UT803_LINE_READER_HPP
#define UT803_LINE_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>

namespace ut803 {

/**
 * @brief Splits a byte stream into '\n'-terminated records.
 *
 * The terminator stays in the record, so a UT803 frame comes out as
 * 11 characters including "\r\n". Bytes after a record stay buffered for
 * the next call. The reader does not own the descriptor.
 */
class LineReader {
public:
    /**
     * @brief Construct a line reader.
     *
     * @param fd Readable descriptor (serial port, pipe, ...)
     */
    explicit LineReader(int fd) noexcept : fd_(fd), last_errno_(0) {}

    /**
     * @brief Read the next record.
     *
     * A record longer than MAX_LINE_LENGTH without a terminator is returned
     * as is; it will fail the caller's length check.
     *
     * @param[out] line Record including its terminator. On Timeout holds
     *             the partial record, which is dropped from the buffer.
     * @param timeout_ms Deadline for the whole record, negative waits forever.
     *             Input already waiting is read even when the deadline has
     *             passed, so 0 returns any buffered record without blocking.
     * @return Error::Ok, Error::Timeout, Error::Interrupted (EINTR, buffered
     *         bytes are kept) or Error::Io (end of stream or read failure)
     */
    Error read_line(std::string& line, int timeout_ms);

    /**
     * @brief errno of the last Error::Io, 0 for end of stream.
     */
    [[nodiscard]] int last_errno() const noexcept {
        return last_errno_;
    }

    /**
     * @brief Number of buffered bytes not yet returned.
     */
    [[nodiscard]] std::size_t pending() const noexcept {
        return pending_.size();
    }

private:
    bool take_line(std::string& line);

    int fd_;
    int last_errno_;
    std::string pending_;
};

} // namespace ut803

#endif // UT803_LINE_READER_HPP
