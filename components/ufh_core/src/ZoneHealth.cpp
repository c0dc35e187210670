#include "ZoneHealth.h"

using HealthTransition = UFHDomain::HealthTransition;
using ZoneStatus = UFHDomain::ZoneStatus;
using ControllerStatus = UFHDomain::ControllerStatus;

static HealthUpdate recordSuccess(UFHDomain::ZoneState &zone, UFHDomain::TimePoint now,
                                  std::chrono::seconds timeout) {
    ZoneStatus previous = zone.status;

    zone.consecutiveFailures = 0;
    zone.lastSuccessfulUpdate = now;
    zone.firstFailure.reset();
    zone.status = ZoneStatus::Normal;
    zone.reachedNormal = true;

    switch (previous) {
    case ZoneStatus::Initializing:
        return {HealthTransition::Initialized, timeout};
    case ZoneStatus::Normal:
        return {HealthTransition::None, timeout};
    case ZoneStatus::Degraded:
    case ZoneStatus::FailSafe:
        return {HealthTransition::Recovered, timeout};
    }

    __builtin_unreachable();
}

HealthUpdate updateZoneHealth(UFHDomain::ZoneState &zone, UFHDomain::TimePoint now,
                              bool tempUnavailable, bool historyFailure, bool valveUnavailable,
                              const UFHDomain::HealthParams &params) {
    std::chrono::seconds timeout =
        zone.reachedNormal ? params.failSafeTimeout : params.initializingTimeout;

    if (!tempUnavailable && !historyFailure && !valveUnavailable) {
        return recordSuccess(zone, now, timeout);
    }

    if (zone.consecutiveFailures < UINT16_MAX) {
        zone.consecutiveFailures++;
    }

    // A zone that never succeeded starts the clock on its first failure
    if (!zone.lastSuccessfulUpdate && !zone.firstFailure) {
        zone.firstFailure = now;
    }
    UFHDomain::TimePoint since =
        zone.lastSuccessfulUpdate ? *zone.lastSuccessfulUpdate : *zone.firstFailure;

    if (now - since > timeout) {
        if (zone.status == ZoneStatus::FailSafe) {
            return {HealthTransition::None, timeout};
        }
        zone.status = ZoneStatus::FailSafe;
        return {HealthTransition::EnteredFailSafe, timeout};
    }

    if (zone.status == ZoneStatus::Normal) {
        zone.status = ZoneStatus::Degraded;
        return {HealthTransition::EnteredDegraded, timeout};
    }

    return {HealthTransition::None, timeout};
}

UFHDomain::ControllerStatus
aggregateControllerStatus(const std::vector<UFHDomain::ZoneStatus> &zoneStatuses) {
    if (zoneStatuses.empty()) {
        return ControllerStatus::Normal;
    }

    int initializing = 0, normal = 0, degraded = 0, failSafe = 0;
    for (ZoneStatus status : zoneStatuses) {
        switch (status) {
        case ZoneStatus::Initializing:
            initializing++;
            break;
        case ZoneStatus::Normal:
            normal++;
            break;
        case ZoneStatus::Degraded:
            degraded++;
            break;
        case ZoneStatus::FailSafe:
            failSafe++;
            break;
        }
    }

    bool anyBad = degraded > 0 || failSafe > 0;
    if (failSafe == static_cast<int>(zoneStatuses.size())) {
        return ControllerStatus::FailSafe;
    }
    if (normal > 0) {
        return anyBad ? ControllerStatus::Degraded : ControllerStatus::Normal;
    }
    if (initializing > 0) {
        return anyBad ? ControllerStatus::Degraded : ControllerStatus::Initializing;
    }
    return ControllerStatus::Degraded;
}
