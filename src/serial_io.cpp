// ============================================================================
// serial_io.cpp - implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "meshbot/serial_io.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for writability waits
#include <cerrno>          // errno, EINTR, EAGAIN
#include <cstring>         // strerror

namespace meshbot {

// ---------------------------------------------------------------------------
// baud_constant()
// ---------------
// Map an integer baud to its termios constant. Unknown values return false
// instead of falling back to a default: a wrong baud looks like a dead radio.
// ---------------------------------------------------------------------------
static bool baud_constant(int baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        case 460800: out = B460800; return true;
        case 921600: out = B921600; return true;
        default:     return false;
    }
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// 8N1 raw mode: no echo, no line discipline, no flow control.
// VMIN=0/VTIME=0 so reads never block; poll() owns all waiting.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err) {
    speed_t sp;
    if (!baud_constant(baud, sp)) { err = "unsupported_baud"; return -1; }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { err = std::string("open_failed:") + std::strerror(errno); return -1; }

    if (!set_raw(fd, sp)) {
        err = "termios_failed";
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) {
        usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);  // USB-serial auto-reset
        tcflush(fd, TCIOFLUSH);                                 // drop reboot chatter
    }
    return fd;
}

// ---------------------------------------------------------------------------
// write_all()
// -----------
// Non-blocking descriptor: on EAGAIN wait for POLLOUT, then continue where
// we stopped. EINTR restarts the same step.
// ---------------------------------------------------------------------------
bool write_all(int fd, const std::string& data, int timeout_ms) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) { off += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;

        pollfd pfd{fd, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) return false;                // timeout or poll error
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;
    }
    return true;
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace meshbot
