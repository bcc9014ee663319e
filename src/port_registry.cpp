// ============================================================================
// port_registry.cpp - implementation for port_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file port_registry.cpp
 */

#include "port_registry.hpp"

#include <algorithm>          // std::transform for case folding
#include <cctype>             // std::tolower
#include <filesystem>         // std::filesystem for walking /dev/serial/by-id and sysfs
#include <fstream>            // reading sysfs attribute files
#include <glob.h>             // glob(3) for tty fallbacks when /dev/serial/by-id is absent
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace lmreadout {

// -------- helpers --------

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern to a vector of strings.
 * glob() allocates; always globfree().
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}

// First line of a sysfs attribute file, or "" if missing.
static std::string read_attr(const fs::path& p) {
    std::ifstream in(p);
    std::string line;
    if (in) std::getline(in, line);
    return line;
}

/*
 * sysfs_description()
 * -------------------
 * /sys/class/tty/<name>/device points at the USB interface for ttyACM, and at
 * the usb-serial port below the interface for ttyUSB. The USB device with the
 * manufacturer/product strings is one or two levels up.
 */
static std::string sysfs_description(const std::string& dev_path) {
    const fs::path dev = fs::path("/sys/class/tty") / fs::path(dev_path).filename() / "device";
    std::error_code ec;
    fs::path real = fs::canonical(dev, ec);
    if (ec) return {};

    for (fs::path p = real.parent_path(); !p.empty() && p != p.root_path(); p = p.parent_path()) {
        std::string product = read_attr(p / "product");
        if (!product.empty()) {
            std::string maker = read_attr(p / "manufacturer");
            return maker.empty() ? product : maker + " " + product;
        }
        if (p.filename().string().rfind("usb", 0) == 0) break;   // reached the bus root
    }
    return {};
}


// -------- public API --------

const char* to_string(FindResult r) {
    switch (r) {
        case FindResult::Ok:        return "ok";
        case FindResult::NotFound:  return "port_not_found";
        case FindResult::Ambiguous: return "multiple_ports_match";
    }
    return "unknown";
}

/*
 * list_ports()
 * ------------
 * Prefer /dev/serial/by-id (its names already carry vendor and model); fall
 * back to classic tty names plus sysfs strings. Errors just shorten the list.
 */
std::vector<PortInfo> list_ports() {
    std::vector<PortInfo> result;

    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;
    if (fs::exists(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink()) continue;
            std::error_code cec;
            auto canon = fs::canonical(e.path(), cec);
            if (!cec) result.push_back({canon.string(), e.path().filename().string()});
        }
    } else {
        std::vector<std::string> ttys;
        append_glob(ttys, "/dev/ttyUSB*");
        append_glob(ttys, "/dev/ttyACM*");
        for (const auto& t : ttys) result.push_back({t, sysfs_description(t)});
    }

    std::sort(result.begin(), result.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.dev_path < b.dev_path; });
    return result;
}


FindResult match_port(const std::vector<PortInfo>& ports, const std::string& name,
                      std::string& dev_path, std::vector<PortInfo>* candidates) {
    const std::string needle = lower(name);
    std::vector<PortInfo> hits;
    for (const auto& p : ports) {
        if (lower(p.description).find(needle) != std::string::npos) hits.push_back(p);
    }
    if (candidates) *candidates = hits;

    if (hits.empty())    return FindResult::NotFound;
    if (hits.size() > 1) return FindResult::Ambiguous;
    dev_path = hits.front().dev_path;
    return FindResult::Ok;
}


FindResult find_port(const std::string& name, std::string& dev_path, std::vector<PortInfo>* candidates) {
    return match_port(list_ports(), name, dev_path, candidates);
}

} // namespace lmreadout
