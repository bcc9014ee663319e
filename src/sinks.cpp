#include "lmreadout/sinks.hpp"
#include "lmreadout/log.hpp"

#include <filesystem>     // create_directories for the output dir
#include <fstream>        // append-mode CSV writes
#include <iomanip>        // std::setprecision
#include <ostream>
#include <sstream>
#include <system_error>   // non-throwing filesystem ops
#include <utility>

namespace fs = std::filesystem;
namespace lmreadout {

static constexpr int CAP_DECIMALS = 4;   // 0.1 fF resolution is well below the board noise

std::string format_row(const Reading& r, const char* sep) {
    std::ostringstream os;
    os << unsigned(r.channel) << sep << r.timestamp << sep
       << std::fixed << std::setprecision(CAP_DECIMALS) << r.capacitance_pf;
    return os.str();
}

// ---------- console ----------

ConsoleSink::ConsoleSink(std::ostream& os) : os_(os) {}

bool ConsoleSink::on_cycle(const Cycle& c) {
    if (!header_done_) {
        os_ << "Channel, UNIX Time Stamp, Capacitance [pf]\n";
        header_done_ = true;
    }
    for (const auto& r : c.readings) os_ << format_row(r, ", ") << "\n";
    os_.flush();
    return static_cast<bool>(os_);
}

// ---------- csv ----------

CsvSink::CsvSink(std::string dir, uint32_t rotate_every, const IClock& clock)
: dir_(std::move(dir)), rotate_every_(rotate_every ? rotate_every : ROTATE_DEFAULT), clock_(clock) {}

/*
 * on_cycle()
 * ----------
 * Phases:
 *   1) every rotate_every cycles (and on the first), pick a fresh file name
 *      from the current UNIX time,
 *   2) make sure the directory exists,
 *   3) open in append mode, write the rows, close.
 */
bool CsvSink::on_cycle(const Cycle& c) {
    if (written_ % rotate_every_ == 0) {
        fs::path p = fs::path(dir_) / ("levelmeters_" + std::to_string(clock_.unix_ms() / 1000) + ".csv");
        path_ = p.string();
        log::info("event=csv_file path=" + path_);
    }
    ++written_;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) { log::error("event=sink_failed sink=csv reason=mkdir dir=" + dir_ + " detail=\"" + ec.message() + "\""); return false; }

    std::ofstream out(path_, std::ios::app);
    if (!out) { log::error("event=sink_failed sink=csv reason=open path=" + path_); return false; }
    for (const auto& r : c.readings) out << format_row(r, ",") << "\n";
    out.flush();
    return static_cast<bool>(out);
}

// ---------- fan-out ----------

bool FanoutSink::on_cycle(const Cycle& c) {
    bool ok = true;
    for (ISink* s : sinks_) ok = s->on_cycle(c) && ok;   // every sink sees the cycle
    return ok;
}

} // namespace lmreadout
