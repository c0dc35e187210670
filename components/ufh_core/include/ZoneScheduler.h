#pragma once

#include <optional>

#include "UFHDomain.h"

// Quota bookkeeping and the per-zone valve decision used in auto mode
namespace ZoneScheduler {
using ValveAction = UFHDomain::ValveAction;
using ValveState = UFHDomain::ValveState;

// Seconds of valve-open time the duty cycle entitles the zone to over a full period.
// No PID state yet means no entitlement.
double requestedDuration(const std::optional<UFHDomain::PIDState> &pid,
                         std::chrono::seconds observationPeriod);

// Seconds the valve has been open so far in the current period. Scales with
// the elapsed part of the period, not the full period.
double usedDuration(double periodStateAvg, double periodElapsedS,
                    std::chrono::seconds observationPeriod);

ValveAction evaluateZone(const UFHDomain::ZoneConfig &config, const UFHDomain::ZoneState &zone,
                         const UFHDomain::ControllerState &controller,
                         const UFHDomain::TimingParams &timing);

bool shouldRequestHeat(const UFHDomain::ZoneState &zone, const UFHDomain::TimingParams &timing,
                       double valveOpenThreshold);

bool computeFlushRequest(bool flushEnabled, bool dhwActive,
                         const std::optional<UFHDomain::TimePoint> &flushUntil,
                         bool anyRegularOn, UFHDomain::TimePoint now);

bool isOn(ValveAction action);

// Only a valve confirmed in the target position is left alone. Unknown and
// unavailable valves are always commanded.
ValveAction onAction(ValveState state);
ValveAction offAction(ValveState state);
} // namespace ZoneScheduler
