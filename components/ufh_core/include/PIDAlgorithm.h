#pragma once

#include <algorithm>
#include <optional>

#include "UFHDomain.h"

// Computes a 0-100 duty cycle from the temperature error. The regulator holds no
// state of its own: the caller keeps the returned PIDState and passes it back on
// the next update.
class PIDAlgorithm {
  public:
    explicit PIDAlgorithm(UFHDomain::PIDGains gains) : gains_(gains) {}

    // Returns prior unchanged if dtS <= 0. The integral accumulator is the i term
    // itself, in duty cycle percent.
    std::optional<UFHDomain::PIDState> update(const std::optional<UFHDomain::PIDState> &prior,
                                              double setpointC, double currentC,
                                              double dtS) const;

    // Accepts a persisted state without recomputing it, clamping the integral
    // to the configured limits
    UFHDomain::PIDState restore(const UFHDomain::PIDState &state) const;

    const UFHDomain::PIDGains &gains() const { return gains_; }

  private:
    UFHDomain::PIDGains gains_;

    static double clamp(double value, double minValue, double maxValue) {
        return std::max(minValue, std::min(value, maxValue));
    }
};
