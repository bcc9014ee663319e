#pragma once
/**
 * @file clock.hpp
 * @brief Time source for the scheduler: wall clock for stamps, steady clock for pacing.
 *
 * The scheduler never calls std::chrono directly so the tests can drive it with a
 * manual clock whose sleep just advances time.
 */

#include <chrono>
#include <cstdint>
#include <thread>

namespace lmreadout {

class IClock {
public:
    virtual ~IClock() = default;
    virtual int64_t unix_ms() const = 0;      ///< Wall clock, for Reading timestamps
    virtual int64_t steady_ms() const = 0;    ///< Monotonic, for cycle pacing
    virtual void    sleep_ms(int64_t ms) = 0;
};

class SystemClock : public IClock {
public:
    int64_t unix_ms() const override {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    int64_t steady_ms() const override {
        using namespace std::chrono;
        return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

    void sleep_ms(int64_t ms) override {
        if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
};

} // namespace lmreadout
