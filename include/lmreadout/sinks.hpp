#pragma once
/**
 * @file sinks.hpp
 * @brief Where finished cycles go: console, rotating CSV files, or both.
 *
 * The scheduler hands every Cycle to exactly one ISink and keeps nothing.
 * Row format is the same everywhere: `channel, unix timestamp, capacitance [pF]`.
 *
 * CSV files are named `levelmeters_<unix>.csv` and live under the output
 * directory (default ./outputs/). A new file is started every `rotate_every`
 * cycles so a week-long fill does not end up in one multi-gigabyte file.
 */

#include "lmreadout/types.hpp"
#include "lmreadout/clock.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace lmreadout {

class ISink {
public:
    virtual ~ISink() = default;
    /// @return false if the cycle could not be stored; the scheduler logs and carries on.
    virtual bool on_cycle(const Cycle& c) = 0;
};

/// "1, 1712345678, 123.4567" lines, header printed once.
class ConsoleSink : public ISink {
public:
    explicit ConsoleSink(std::ostream& os);
    bool on_cycle(const Cycle& c) override;

private:
    std::ostream& os_;
    bool header_done_{false};
};

class CsvSink : public ISink {
public:
    static constexpr uint32_t ROTATE_DEFAULT = 2000;

    CsvSink(std::string dir, uint32_t rotate_every, const IClock& clock);
    bool on_cycle(const Cycle& c) override;

    /// File the most recent cycle went to; empty before the first cycle.
    const std::string& current_path() const { return path_; }

private:
    std::string   dir_;
    uint32_t      rotate_every_;
    const IClock& clock_;
    uint64_t      written_{0};
    std::string   path_;
};

/// Forwards to every attached sink; fails if any of them failed.
class FanoutSink : public ISink {
public:
    void add(ISink& s) { sinks_.push_back(&s); }
    bool on_cycle(const Cycle& c) override;
    size_t size() const { return sinks_.size(); }

private:
    std::vector<ISink*> sinks_;
};

/// Shared row formatting: "<channel><sep><timestamp><sep><capacitance>".
std::string format_row(const Reading& r, const char* sep);

} // namespace lmreadout
