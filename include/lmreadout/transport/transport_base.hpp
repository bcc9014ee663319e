#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal byte-pipe interface the sampler talks through.
 *
 * Implemented by the Linux termios port (transport_linux_serial.hpp) and by the
 * scripted in-memory port the tests use.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace lmreadout::transport {

// Return codes kept as plain enums; nothing in the acquisition path throws.
enum class OpenResult : uint8_t { Ok=0, ConnectionError=1, ConfigurationError=2 };
enum class TxResult   : uint8_t { Ok=0, Error=1 };
enum class RxResult   : uint8_t { None=0, Ok=1, Error=2 };

enum class Parity : uint8_t { None=0, Even=1, Odd=2 };

struct LineConfig {
  std::string path;          // e.g. /dev/ttyUSB0 or /dev/serial/by-id/usb-MOXA...
  int     baud{115200};
  Parity  parity{Parity::None};
  uint8_t stop_bits{1};      // 1 or 2
  int     timeout_ms{2000};  // default read timeout
};

/**
 * @brief Transport trait the acquisition core relies on.
 *
 * Contract:
 *  - open(cfg) acquires exclusive access and applies line settings.
 *  - write(buf,len) sends the whole frame or returns Error (no partial success).
 *  - read(buf,cap,out_len,timeout_ms) waits at most timeout_ms; RxResult::None
 *    with out_len == 0 is a clean timeout.
 *  - discard_input() drops stale bytes left by an earlier, late response.
 *  - close() is idempotent.
 *  - last_error() is a short reason token for logs ("no_such_device", "busy", ...).
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual OpenResult  open(const LineConfig& cfg) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual void        discard_input() = 0;
  virtual const char* name() const = 0;
  virtual const std::string& last_error() const = 0;
};

} // namespace lmreadout::transport
