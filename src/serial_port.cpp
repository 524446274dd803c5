/**
 * @file serial_port.cpp
 * @brief Serial port with the UT803 line discipline.
 */

#include <ut803/serial_port.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ut803 {

namespace {

static_assert(BAUD_RATE == 19200, "line speed constant below must match BAUD_RATE");
constexpr speed_t LINE_SPEED = B19200;

} // namespace

void apply_line_settings(termios& tio) noexcept {
    cfmakeraw(&tio);
    cfsetispeed(&tio, LINE_SPEED);
    cfsetospeed(&tio, LINE_SPEED);

    tio.c_cflag &= ~static_cast<tcflag_t>(CSIZE | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS7 | PARENB | PARODD | CLOCAL | CREAD;

    tio.c_iflag |= IXON | IXOFF;
    tio.c_iflag &= ~static_cast<tcflag_t>(IXANY);

    // Timing is handled with poll() in LineReader
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
}

#if !UT803_NO_EXCEPTIONS
SerialPort::SerialPort(const std::string& device) : SerialPort() {
    if (open(device) != Error::Ok) {
        throw SerialException(std::string(failed_step_) + " " + device + ": " +
                              std::strerror(open_errno_));
    }
}
#endif

SerialPort::~SerialPort() {
    close();
}

Error SerialPort::fail(int fd, const char* step, int error) noexcept {
    ::close(fd);
    open_errno_ = error;
    failed_step_ = step;
    return Error::Io;
}

Error SerialPort::open(const std::string& device) {
    close();
    device_ = device;
    open_errno_ = 0;
    failed_step_ = "";

    int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        open_errno_ = errno;
        failed_step_ = "Cannot open";
        return Error::Io;
    }

    termios saved;
    if (::tcgetattr(fd, &saved) != 0) {
        return fail(fd, "Cannot read line settings of", errno);
    }

    termios tio = saved;
    apply_line_settings(tio);
    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
        return fail(fd, "Cannot configure", errno);
    }

    int dtr = TIOCM_DTR;
    int rts = TIOCM_RTS;
    if (::ioctl(fd, TIOCMBIS, &dtr) != 0 || ::ioctl(fd, TIOCMBIC, &rts) != 0) {
        int error = errno;
        ::tcsetattr(fd, TCSANOW, &saved);
        return fail(fd, "Cannot set handshake lines of", error);
    }

    if (::tcflush(fd, TCIFLUSH) != 0) {
        int error = errno;
        ::tcsetattr(fd, TCSANOW, &saved);
        return fail(fd, "Cannot flush", error);
    }

    fd_ = fd;
    saved_ = saved;
    reader_ = LineReader(fd_);
    return Error::Ok;
}

void SerialPort::close() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::tcsetattr(fd_, TCSANOW, &saved_);
    ::close(fd_);
    fd_ = -1;
    reader_ = LineReader(-1);
}

} // namespace ut803
