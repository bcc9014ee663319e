#include "lmreadout/calibration.hpp"

#include <cmath>
#include <utility>      // std::swap

namespace lmreadout::calibration {

Coeffs identity() { return linear(0.0, 1.0); }

Coeffs linear(double offset, double scale) {
    Coeffs c;
    c.push_back(offset);
    c.push_back(scale);
    return c;
}

// Horner, highest order first.
double apply(const Coeffs& c, double raw) {
    double acc = 0.0;
    for (size_t i = c.size(); i-- > 0;) acc = acc * raw + c[i];
    return acc;
}

// Derivative of the cubic at x.
static double slope(const Coeffs& c, double x) {
    double d = 0.0;
    for (size_t i = c.size(); i-- > 1;) d = d * x + static_cast<double>(i) * c[i];
    return d;
}

Check validate(const Coeffs& c, double raw_min, double raw_max) {
    if (c.empty()) return Check::Empty;
    for (double v : c) if (!std::isfinite(v)) return Check::NonFinite;
    if (raw_max < raw_min) std::swap(raw_min, raw_max);

    // The slope is at most quadratic: its extremes on the interval sit at the two
    // ends or at the vertex.
    double pts[3] = { raw_min, raw_max, raw_min };
    int n = 2;
    if (c.size() == 4 && c[3] != 0.0) {
        double vx = -c[2] / (3.0 * c[3]);
        if (vx > raw_min && vx < raw_max) pts[n++] = vx;
    }

    bool pos = false, neg = false;
    for (int i = 0; i < n; ++i) {
        double d = slope(c, pts[i]);
        if (d > 0.0) pos = true;
        if (d < 0.0) neg = true;
    }
    if (pos == neg) return Check::NotMonotonic;    // changes sign, or flat everywhere
    return Check::Ok;
}

const char* to_string(Check c) {
    switch (c) {
        case Check::Ok:           return "ok";
        case Check::Empty:        return "empty_coefficients";
        case Check::NonFinite:    return "non_finite_coefficient";
        case Check::NotMonotonic: return "not_monotonic";
    }
    return "unknown";
}

} // namespace lmreadout::calibration
