#pragma once

#include <vector>

#include "UFHDomain.h"

struct HealthUpdate {
    UFHDomain::HealthTransition transition;
    std::chrono::seconds timeoutUsed;

    bool operator==(const HealthUpdate &) const = default;
};

// Advances the zone's health from this tick's failure signals. Any signal continues
// the failure streak and a tick without one resets it. Until the zone has been
// NORMAL once, the shorter initializing timeout applies.
HealthUpdate updateZoneHealth(UFHDomain::ZoneState &zone, UFHDomain::TimePoint now,
                              bool tempUnavailable, bool historyFailure, bool valveUnavailable,
                              const UFHDomain::HealthParams &params);

UFHDomain::ControllerStatus
aggregateControllerStatus(const std::vector<UFHDomain::ZoneStatus> &zoneStatuses);
