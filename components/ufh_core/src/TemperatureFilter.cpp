#include "TemperatureFilter.h"

#include <cmath>

double emaFilter(double raw, double previous, double tauS, double dtS) {
    if (tauS <= 0 || std::isnan(previous)) {
        return raw;
    }
    if (dtS <= 0) {
        return previous;
    }

    double alpha = dtS / (tauS + dtS);
    return alpha * raw + (1 - alpha) * previous;
}

double roundForDisplay(double raw, double previousDisplay, double precision, double hysteresis) {
    double target = std::round(raw / precision) * precision;
    if (std::isnan(previousDisplay)) {
        return target;
    }

    // Same step, within floating point noise
    if (std::fabs(target - previousDisplay) < precision / 2) {
        return previousDisplay;
    }

    if (target > previousDisplay) {
        return raw >= previousDisplay + precision / 2 + hysteresis ? target : previousDisplay;
    }
    return raw <= previousDisplay - precision / 2 - hysteresis ? target : previousDisplay;
}
