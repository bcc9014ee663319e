#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport (termios, poll-based reads, exclusive open).
 *
 * @details
 * Talks to the readout board through a USB-to-serial adapter (Moxa UPort 1130 in
 * RS-422 mode, or the FTDI bridge on the UTI evaluation board). The RS-422 /
 * RS-232 selection is a driver setting made out-of-band with `setserial`; this
 * class only configures the line discipline.
 *
 * OPEN SEQUENCE
 * -------------
 *   1) ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK)   -> ConnectionError on failure
 *   2) flock(LOCK_EX | LOCK_NB) + TIOCEXCL             -> ConnectionError if held elsewhere
 *   3) cfmakeraw, baud, parity, stop bits, CLOCAL|CREAD -> ConfigurationError if rejected
 *   4) read back the attributes and compare             -> ConfigurationError on mismatch
 *   5) tcflush(TCIOFLUSH) to drop boot chatter
 *
 * The descriptor is released in the destructor, so a LinuxSerial on the stack
 * never leaks the port regardless of how the caller leaves scope.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "lmreadout/transport/transport_base.hpp"
#include <string>

namespace lmreadout::transport {

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  OpenResult  open(const LineConfig& cfg) override;
  void        close() override;
  bool        is_open() const override { return fd_ >= 0; }
  TxResult    write(const uint8_t* data, std::size_t len) override;
  RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  void        discard_input() override;
  const char* name() const override { return "linux-serial"; }
  const std::string& last_error() const override { return last_error_; }

  const LineConfig& config() const { return cfg_; }

private:
  OpenResult fail(OpenResult r, const char* reason);

  int         fd_{-1};
  LineConfig  cfg_;
  std::string last_error_;
};

} // namespace lmreadout::transport
