#include "PIDAlgorithm.h"

using PIDState = UFHDomain::PIDState;

std::optional<PIDState> PIDAlgorithm::update(const std::optional<PIDState> &prior,
                                             double setpointC, double currentC,
                                             double dtS) const {
    if (dtS <= 0) {
        return prior;
    }

    double priorIntegral = prior ? prior->iTerm : 0.0;
    double priorError = prior ? prior->error : 0.0;

    double error = setpointC - currentC;
    double p = gains_.kp * error;
    double i = clamp(priorIntegral + gains_.ki * error * dtS, gains_.integralMin,
                     gains_.integralMax);
    double d = gains_.kd * (error - priorError) / dtS;

    return PIDState{
        .error = error,
        .pTerm = p,
        .iTerm = i,
        .dTerm = d,
        .dutyCycle = clamp(p + i + d, 0.0, 100.0),
    };
}

PIDState PIDAlgorithm::restore(const PIDState &state) const {
    PIDState restored = state;
    restored.iTerm = clamp(state.iTerm, gains_.integralMin, gains_.integralMax);
    restored.dutyCycle = clamp(state.dutyCycle, 0.0, 100.0);
    return restored;
}
