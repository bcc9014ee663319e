// ============================================================================
// transport_linux_serial.cpp - implementation for transport_linux_serial.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file transport_linux_serial.cpp
 */

#include "lmreadout/transport/transport_linux_serial.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based reads
#include <sys/file.h>      // flock(2) for the exclusive-holder check
#include <sys/ioctl.h>     // TIOCEXCL
#include <cerrno>

namespace lmreadout::transport {

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map an integer baud rate to its termios constant. There is no fallback
// rate: an unsupported one is a configuration error.
// ---------------------------------------------------------------------------
static bool baud_to_speed(int baud, speed_t& out) {
    switch (baud) {
        case 1200:   out = B1200;   return true;
        case 2400:   out = B2400;   return true;
        case 4800:   out = B4800;   return true;
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
#ifdef B230400
        case 230400: out = B230400; return true;
#endif
#ifdef B460800
        case 460800: out = B460800; return true;
#endif
        default:     return false;
    }
}

// ---------------------------------------------------------------------------
// set_line()
// ----------
// Raw 8-bit mode with the requested parity and stop bits.
// - VMIN=0, VTIME=0: reads never block in the driver; poll() owns the timing.
// - No hardware or software flow control.
// ---------------------------------------------------------------------------
static bool set_line(int fd, speed_t sp, Parity parity, uint8_t stop_bits) {
    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) return false;

    ::cfmakeraw(&tio);                              // 8 data bits, no echo, no line editing
    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);

    tio.c_cflag |= (CLOCAL | CREAD);                // ignore modem ctrl, enable receiver
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag &= ~(PARENB | PARODD);
    if (parity == Parity::Even) tio.c_cflag |= PARENB;
    if (parity == Parity::Odd)  tio.c_cflag |= (PARENB | PARODD);
    if (stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                tio.c_cflag &= ~CSTOPB;

    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    return ::tcsetattr(fd, TCSANOW, &tio) == 0;
}

// tcsetattr() succeeds if *any* of the changes were applied; read back to be sure.
static bool line_matches(int fd, speed_t sp, Parity parity, uint8_t stop_bits) {
    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) return false;
    if (::cfgetospeed(&tio) != sp) return false;

    tcflag_t want = 0;
    if (parity == Parity::Even) want |= PARENB;
    if (parity == Parity::Odd)  want |= (PARENB | PARODD);
    if (stop_bits == 2)         want |= CSTOPB;
    return (tio.c_cflag & (PARENB | PARODD | CSTOPB)) == want;
}


OpenResult LinuxSerial::fail(OpenResult r, const char* reason) {
    last_error_ = reason;
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    return r;
}


OpenResult LinuxSerial::open(const LineConfig& cfg) {
    close();                                         // re-open replaces any earlier session
    cfg_ = cfg;
    last_error_.clear();

    if (cfg.path.empty()) return fail(OpenResult::ConnectionError, "no_port");

    speed_t sp = B115200;
    if (!baud_to_speed(cfg.baud, sp))          return fail(OpenResult::ConfigurationError, "unsupported_baud");
    if (cfg.stop_bits != 1 && cfg.stop_bits != 2) return fail(OpenResult::ConfigurationError, "bad_stop_bits");

    fd_ = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        switch (errno) {
            case ENOENT: return fail(OpenResult::ConnectionError, "no_such_device");
            case EACCES: return fail(OpenResult::ConnectionError, "permission_denied");
            case EBUSY:  return fail(OpenResult::ConnectionError, "busy");
            default:     return fail(OpenResult::ConnectionError, "open_failed");
        }
    }

    // Another process (or another LinuxSerial in this one) holding the port.
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) return fail(OpenResult::ConnectionError, "busy");
        return fail(OpenResult::ConnectionError, "lock_failed");
    }

    if (!::isatty(fd_)) return fail(OpenResult::ConfigurationError, "not_a_tty");
    ::ioctl(fd_, TIOCEXCL);                          // best effort; flock is the real guard

    if (!set_line(fd_, sp, cfg.parity, cfg.stop_bits))     return fail(OpenResult::ConfigurationError, "line_rejected");
    if (!line_matches(fd_, sp, cfg.parity, cfg.stop_bits)) return fail(OpenResult::ConfigurationError, "line_not_applied");

    ::tcflush(fd_, TCIOFLUSH);                       // drop whatever the adapter buffered
    return OpenResult::Ok;
}


void LinuxSerial::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }        // closing also drops the flock
}


// ---------------------------------------------------------------------------
// write()
// -------
// One write(2) of the whole frame after waiting for the fd to become writable.
// A short write is reported as an error rather than looped; the sampler
// discards input and retries the whole request instead.
// ---------------------------------------------------------------------------
TxResult LinuxSerial::write(const uint8_t* data, std::size_t len) {
    if (fd_ < 0 || !data || !len) { last_error_ = "not_open"; return TxResult::Error; }

    pollfd pfd{fd_, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, cfg_.timeout_ms);
    if (pr <= 0 || !(pfd.revents & POLLOUT)) { last_error_ = "write_timeout"; return TxResult::Error; }

    ssize_t w = ::write(fd_, data, len);
    if (w < 0) {
        last_error_ = (errno == EPIPE || errno == EIO) ? "broken_pipe" : "write_failed";
        return TxResult::Error;
    }
    if (static_cast<std::size_t>(w) != len) { last_error_ = "partial_write"; return TxResult::Error; }
    return TxResult::Ok;
}


// ---------------------------------------------------------------------------
// read()
// ------
// poll() for up to timeout_ms, then one non-blocking read of up to cap bytes.
// EINTR is a clean "nothing yet": the caller checks its stop flag and decides.
// ---------------------------------------------------------------------------
RxResult LinuxSerial::read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) { last_error_ = "not_open"; return RxResult::Error; }

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    if (pr == 0) return RxResult::None;              // timeout expired
    if (pr < 0) {
        if (errno == EINTR) return RxResult::None;
        last_error_ = "poll_failed";
        return RxResult::Error;
    }

    if (pfd.revents & POLLIN) {
        ssize_t r = ::read(fd_, out, cap);
        if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
        if (r == 0 || errno == EAGAIN || errno == EWOULDBLOCK) return RxResult::None;
        last_error_ = "read_failed";
        return RxResult::Error;
    }
    last_error_ = (pfd.revents & POLLHUP) ? "hangup" : "poll_error";
    return RxResult::Error;
}


void LinuxSerial::discard_input() {
    if (fd_ >= 0) ::tcflush(fd_, TCIFLUSH);
}

} // namespace lmreadout::transport
