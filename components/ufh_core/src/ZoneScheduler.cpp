#include "ZoneScheduler.h"

#include <algorithm>

using CircuitType = UFHDomain::CircuitType;
using ValveAction = UFHDomain::ValveAction;
using ValveState = UFHDomain::ValveState;

double ZoneScheduler::requestedDuration(const std::optional<UFHDomain::PIDState> &pid,
                                        std::chrono::seconds observationPeriod) {
    if (!pid) {
        return 0;
    }
    double periodS = observationPeriod.count();
    return std::clamp(pid->dutyCycle / 100.0 * periodS, 0.0, periodS);
}

double ZoneScheduler::usedDuration(double periodStateAvg, double periodElapsedS,
                                   std::chrono::seconds observationPeriod) {
    double periodS = observationPeriod.count();
    double elapsedS = std::clamp(periodElapsedS, 0.0, periodS);
    return std::clamp(periodStateAvg, 0.0, 1.0) * elapsedS;
}

bool ZoneScheduler::isOn(ValveAction action) {
    return action == ValveAction::TurnOn || action == ValveAction::StayOn;
}

ValveAction ZoneScheduler::onAction(ValveState state) {
    return state == ValveState::On ? ValveAction::StayOn : ValveAction::TurnOn;
}

ValveAction ZoneScheduler::offAction(ValveState state) {
    return state == ValveState::Off ? ValveAction::StayOff : ValveAction::TurnOff;
}

ValveAction ZoneScheduler::evaluateZone(const UFHDomain::ZoneConfig &config,
                                        const UFHDomain::ZoneState &zone,
                                        const UFHDomain::ControllerState &controller,
                                        const UFHDomain::TimingParams &timing) {
    if (!zone.enabled) {
        return offAction(zone.valveState);
    }

    if (config.circuitType == CircuitType::Flush && controller.flushRequest) {
        return onAction(zone.valveState);
    }

    // Too close to the end of the period to start or stop a run that matters
    double periodRemainingS = timing.observationPeriod.count() - controller.periodElapsedS;
    if (periodRemainingS < timing.minRunTime.count()) {
        return zone.valveState == ValveState::On ? ValveAction::StayOn
                                                 : offAction(zone.valveState);
    }

    if (zone.usedDurationS >= zone.requestedDurationS) {
        return offAction(zone.valveState);
    }
    // A running valve uses up its quota, the minimum run only gates new starts
    if (zone.valveState == ValveState::On) {
        return ValveAction::StayOn;
    }
    if (zone.remainingQuotaS() < timing.minRunTime.count()) {
        return offAction(zone.valveState);
    }
    // New regular runs yield to hot water
    if (controller.dhwActive && config.circuitType == CircuitType::Regular) {
        return offAction(zone.valveState);
    }

    return onAction(zone.valveState);
}

bool ZoneScheduler::shouldRequestHeat(const UFHDomain::ZoneState &zone,
                                      const UFHDomain::TimingParams &timing,
                                      double valveOpenThreshold) {
    if (zone.valveState != ValveState::On || !zone.enabled) {
        return false;
    }
    // Commanded is not enough, the valve must have been physically open long enough
    if (zone.openStateAvg < valveOpenThreshold) {
        return false;
    }
    return zone.remainingQuotaS() >= timing.closingWarning.count();
}

bool ZoneScheduler::computeFlushRequest(bool flushEnabled, bool dhwActive,
                                        const std::optional<UFHDomain::TimePoint> &flushUntil,
                                        bool anyRegularOn, UFHDomain::TimePoint now) {
    if (!flushEnabled || anyRegularOn) {
        return false;
    }
    return dhwActive || (flushUntil && now < *flushUntil);
}
