#pragma once
/**
 * @page lmr-port-registry Serial Port Discovery
 * @file port_registry.hpp
 * @brief Find the USB-to-serial adapter the level-meter board hangs off.
 *
 * @details
 * PURPOSE
 * -------
 * ttyUSB numbering shifts whenever adapters are replugged or the host reboots.
 * Operators know the adapter by name ("moxa" for the UPort 1130 in front of the
 * readout board, "ftdi" for the UTI evaluation board), so the CLI resolves that
 * name to a device path at startup instead of hard-coding /dev/ttyUSB0.
 *
 * WHAT THIS DOES
 * --------------
 * - Lists candidates from `/dev/serial/by-id` (stable, descriptive symlinks such as
 *   `usb-MOXA_UPort_1130-if00-port0`), resolving each to its canonical /dev node.
 * - Falls back to globbing `/dev/ttyUSB*` and `/dev/ttyACM*` when by-id is absent,
 *   describing each from the USB `manufacturer`/`product` strings in sysfs.
 * - find_port() picks the one candidate whose description contains the name,
 *   case-insensitively. Zero or several matches are errors: guessing the wrong
 *   adapter would talk the board protocol to some other device.
 *
 * Discovery never opens a port. RS-422 mode and permissions are provisioned
 * out-of-band (setserial, udev rules, dialout group).
 *
 * EXAMPLE
 * -------
 * @code
 *   std::string dev;
 *   std::vector<lmreadout::PortInfo> seen;
 *   switch (lmreadout::find_port("moxa", dev, &seen)) {
 *     case lmreadout::FindResult::Ok:        break;
 *     case lmreadout::FindResult::NotFound:  // no adapter plugged in
 *     case lmreadout::FindResult::Ambiguous: // print `seen`, ask for --port
 *       return 1;
 *   }
 * @endcode
 *
 * @note Linux-only. Other systems would need their own enumeration.
 */

#include <string>
#include <vector>

namespace lmreadout {

/**
 * @struct PortInfo
 * @brief One serial device candidate.
 */
struct PortInfo {
    std::string dev_path;     /**< Canonical device node, e.g. "/dev/ttyUSB0". */
    std::string description;  /**< by-id name or "manufacturer product" from sysfs. */
};

enum class FindResult { Ok, NotFound, Ambiguous };

const char* to_string(FindResult r);

/// Enumerate serial device candidates on this host.
std::vector<PortInfo> list_ports();

/**
 * @brief Resolve an adapter name fragment to a device path.
 * @param name        Case-insensitive fragment, e.g. "moxa".
 * @param dev_path    Set on FindResult::Ok.
 * @param candidates  Optional: receives every matching port (useful on Ambiguous).
 */
FindResult find_port(const std::string& name, std::string& dev_path,
                     std::vector<PortInfo>* candidates = nullptr);

/// Pure matching step of find_port(), split out for tests.
FindResult match_port(const std::vector<PortInfo>& ports, const std::string& name,
                      std::string& dev_path, std::vector<PortInfo>* candidates = nullptr);

} // namespace lmreadout
