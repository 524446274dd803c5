/**
 * @file serial_port.hpp
 * @brief Serial port with the UT803 line discipline.
 *
 * 19200 baud, 7 data bits, odd parity, 1 stop bit, XON/XOFF flow control.
 * The optical RS-232 cable powers its transmitter from the handshake lines,
 * so DTR is asserted and RTS cleared once the port is configured.
 */

#ifndef UT803_SERIAL_PORT_HPP
#define UT803_SERIAL_PORT_HPP

#include "config.hpp"
#include "error.hpp"
#include "line_reader.hpp"

#include <string>

#include <termios.h>

namespace ut803 {

/**
 * @brief Apply the UT803 line settings to a termios structure.
 *
 * Raw input and output, receiver enabled, modem status lines ignored.
 */
void apply_line_settings(termios& tio) noexcept;

/**
 * @brief RAII serial port.
 *
 * The saved line settings are restored and the descriptor closed on
 * destruction.
 */
class SerialPort {
public:
    /**
     * @brief Construct a closed port, see open().
     */
    SerialPort() noexcept : fd_(-1), saved_{}, reader_(-1), open_errno_(0), failed_step_("") {}

#if !UT803_NO_EXCEPTIONS
    /**
     * @brief Open and configure a serial device.
     *
     * @param device Device path, e.g. /dev/ttyUSB0
     * @throws SerialException if the device cannot be opened or configured
     */
    explicit SerialPort(const std::string& device);
#endif

    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    /**
     * @brief Open and configure a serial device.
     *
     * A port that is already open is closed first. On failure the port
     * stays closed and last_errno() holds the cause.
     *
     * @param device Device path, e.g. /dev/ttyUSB0
     * @return Error::Ok or Error::Io
     */
    Error open(const std::string& device);

    /**
     * @brief Restore the saved line settings and close the descriptor.
     */
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept {
        return fd_ >= 0;
    }

    /**
     * @brief Read the next record, see LineReader::read_line().
     *
     * Returns Error::Io on a closed port.
     */
    Error read_line(std::string& line, int timeout_ms) {
        return reader_.read_line(line, timeout_ms);
    }

    /**
     * @brief errno of the last failure: open() while closed, reads while open.
     */
    [[nodiscard]] int last_errno() const noexcept {
        return is_open() ? reader_.last_errno() : open_errno_;
    }

    /**
     * @brief Setup step that made the last open() fail, e.g. "Cannot open".
     */
    [[nodiscard]] const char* failed_step() const noexcept {
        return failed_step_;
    }

    [[nodiscard]] const std::string& device() const noexcept {
        return device_;
    }

private:
    Error fail(int fd, const char* step, int error) noexcept;

    std::string device_;
    int fd_;
    termios saved_;
    LineReader reader_;
    int open_errno_;
    const char* failed_step_;
};

} // namespace ut803

#endif // UT803_SERIAL_PORT_HPP
