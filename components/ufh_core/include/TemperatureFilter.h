#pragma once

#define DISPLAY_PRECISION 0.1
#define DISPLAY_HYSTERESIS 0.03

// Exponential moving average with alpha = dt / (tau + dt). Returns raw unfiltered
// when previous is NaN or tauS <= 0, and previous when dtS <= 0.
double emaFilter(double raw, double previous, double tauS, double dtS);

// Quantizes to DISPLAY_PRECISION. The display only moves once raw is more than
// DISPLAY_HYSTERESIS past the midpoint between the previous and the next step.
// previousDisplay is NaN when nothing has been displayed yet.
double roundForDisplay(double raw, double previousDisplay, double precision = DISPLAY_PRECISION,
                       double hysteresis = DISPLAY_HYSTERESIS);
