#pragma once
/**
 * @file calibration.hpp
 * @brief raw value -> capacitance [pF], per channel. Pure functions, no state.
 *
 * Each channel carries up to four polynomial coefficients, lowest order first:
 *
 *     C(x) = c0 + c1*x + c2*x^2 + c3*x^3
 *
 * The readout board already reports picofarads, so its channels default to the
 * identity [0, 1]. The UTI board reports a period ratio; its channel uses
 * [0, C_ref] with the reference capacitor value.
 *
 * validate() is run once when the configuration is loaded. apply() is then
 * deterministic and monotonic over the validated range.
 */

#include "lmreadout/types.hpp"

namespace lmreadout::calibration {

enum class Check : uint8_t { Ok=0, Empty=1, NonFinite=2, NotMonotonic=3 };

static constexpr double RAW_MIN_DEFAULT = 0.0;
static constexpr double RAW_MAX_DEFAULT = 10000.0;

/// [0, 1]
Coeffs identity();

/// [offset, scale]
Coeffs linear(double offset, double scale);

double apply(const Coeffs& c, double raw);

inline double apply(const Channel& ch, double raw) { return apply(ch.coeffs, raw); }

/// Reject empty or non-finite coefficients, and polynomials whose slope changes
/// sign (or is zero everywhere) on [raw_min, raw_max].
Check validate(const Coeffs& c,
               double raw_min = RAW_MIN_DEFAULT,
               double raw_max = RAW_MAX_DEFAULT);

const char* to_string(Check c);

} // namespace lmreadout::calibration
