#pragma once
/**
 * @file cancel.hpp
 * @brief Cooperative stop flag, tripped by Ctrl+C.
 *
 * The scheduler polls stop_requested() before every sample and while idling
 * between cycles. A sample already on the wire finishes (bounded by the read
 * timeout) before the loop unwinds, so the port is always released cleanly.
 */

#include <atomic>

namespace lmreadout {

class CancelToken {
public:
    void request_stop()          { flag_.store(true); }
    bool stop_requested() const  { return flag_.load(); }
    void reset()                 { flag_.store(false); }

private:
    std::atomic<bool> flag_{false};   // lock-free, so safe to set from a signal handler
};

/**
 * @brief Route SIGINT and SIGTERM to @p token.
 *
 * Installed without SA_RESTART, so a blocking poll() in the transport returns
 * early with EINTR and the stop is noticed within one read.
 *
 * @return false if sigaction() failed.
 */
bool install_signal_handlers(CancelToken& token);

} // namespace lmreadout
