#include "UFHDomain.h"

#include <cstring>
#include <set>

std::vector<UFHDomain::Preset> UFHDomain::defaultPresets() {
    return {
        {.name = "comfort", .setpointC = 22.0},
        {.name = "eco", .setpointC = 19.0},
        {.name = "away", .setpointC = 16.0},
        {.name = "boost", .setpointC = 25.0},
    };
}

UFHDomain::TimePoint UFHDomain::getObservationStart(TimePoint now,
                                                    std::chrono::seconds observationPeriod) {
    // Periods are aligned to UTC midnight so every controller agrees on boundaries
    TimePoint midnight = std::chrono::floor<std::chrono::days>(now);
    std::chrono::seconds sinceMidnight =
        std::chrono::duration_cast<std::chrono::seconds>(now - midnight);

    return midnight + (sinceMidnight / observationPeriod) * observationPeriod;
}

static UFHDomain::ConfigErr validateZone(const UFHDomain::ZoneConfig &zone) {
    using ConfigErr = UFHDomain::ConfigErr;

    if (zone.id.empty()) {
        return ConfigErr::NoZoneID;
    }
    const UFHDomain::SetpointLimits &sp = zone.setpoint;
    if (!(sp.minC <= sp.defaultC && sp.defaultC <= sp.maxC)) {
        return ConfigErr::SetpointLimits;
    }
    if (!(zone.pid.integralMin <= zone.pid.integralMax)) {
        return ConfigErr::IntegralLimits;
    }
    if (!(zone.emaTauS >= 0)) {
        return ConfigErr::EMATau;
    }
    for (const UFHDomain::Preset &preset : zone.presets) {
        if (!(sp.minC <= preset.setpointC && preset.setpointC <= sp.maxC)) {
            return ConfigErr::PresetSetpoint;
        }
    }

    return ConfigErr::None;
}

UFHDomain::ConfigErr UFHDomain::validateConfig(const ControllerConfig &config) {
    const TimingParams &t = config.timing;
    std::chrono::seconds zero(0);
    if (t.observationPeriod <= zero || t.minRunTime <= zero || t.valveOpenTime <= zero ||
        t.closingWarning <= zero || t.windowBlockTime <= zero || t.loopInterval <= zero ||
        t.flushDuration <= zero || config.maxTickInterval <= zero) {
        return ConfigErr::Timing;
    }
    if (t.minRunTime >= t.observationPeriod) {
        return ConfigErr::MinRunTime;
    }
    if (config.health.initializingTimeout <= zero || config.health.failSafeTimeout <= zero) {
        return ConfigErr::HealthTimeout;
    }
    if (!(config.valveOpenThreshold >= 0 && config.valveOpenThreshold <= 1) ||
        !(config.windowOpenThreshold >= 0 && config.windowOpenThreshold <= 1)) {
        return ConfigErr::Threshold;
    }

    std::set<std::string> ids;
    for (const ZoneConfig &zone : config.zones) {
        ConfigErr err = validateZone(zone);
        if (err != ConfigErr::None) {
            return err;
        }
        if (!ids.insert(zone.id).second) {
            return ConfigErr::DuplicateZoneID;
        }
    }

    return ConfigErr::None;
}

void UFHDomain::PrintTo(const PIDState &state, std::ostream *os) {
    *os << "PIDState(err=" << state.error << ",p=" << state.pTerm << ",i=" << state.iTerm
        << ",d=" << state.dTerm << ",duty=" << state.dutyCycle << ")";
}

void UFHDomain::PrintTo(ValveAction action, std::ostream *os) { *os << valveActionToS(action); }

void UFHDomain::PrintTo(ZoneStatus status, std::ostream *os) { *os << zoneStatusToS(status); }

void UFHDomain::PrintTo(ControllerStatus status, std::ostream *os) {
    *os << controllerStatusToS(status);
}

void UFHDomain::PrintTo(HealthTransition transition, std::ostream *os) {
    *os << healthTransitionToS(transition);
}

const char *UFHDomain::circuitTypeToS(CircuitType type) {
    switch (type) {
    case CircuitType::Regular:
        return "regular";
    case CircuitType::Flush:
        return "flush";
    }

    __builtin_unreachable();
}

const char *UFHDomain::valveStateToS(ValveState state) {
    switch (state) {
    case ValveState::On:
        return "on";
    case ValveState::Off:
        return "off";
    case ValveState::Unknown:
        return "unknown";
    case ValveState::Unavailable:
        return "unavailable";
    }

    __builtin_unreachable();
}

const char *UFHDomain::valveActionToS(ValveAction action) {
    switch (action) {
    case ValveAction::TurnOn:
        return "turn_on";
    case ValveAction::TurnOff:
        return "turn_off";
    case ValveAction::StayOn:
        return "stay_on";
    case ValveAction::StayOff:
        return "stay_off";
    }

    __builtin_unreachable();
}

static constexpr const char *OperationModeStrings[] = {"auto",   "flush",   "cycle",
                                                       "all_on", "all_off", "disabled"};
const char *UFHDomain::operationModeToS(OperationMode mode) {
    return OperationModeStrings[static_cast<int>(mode)];
}

bool UFHDomain::operationModeFromS(const char *str, OperationMode *mode) {
    for (size_t i = 0; i < sizeof(OperationModeStrings) / sizeof(OperationModeStrings[0]); i++) {
        if (strcmp(str, OperationModeStrings[i]) == 0) {
            *mode = static_cast<OperationMode>(i);
            return true;
        }
    }
    return false;
}

const char *UFHDomain::secondaryModeToS(SecondaryMode mode) {
    switch (mode) {
    case SecondaryMode::Auto:
        return "auto";
    case SecondaryMode::Winter:
        return "winter";
    case SecondaryMode::Summer:
        return "summer";
    }

    __builtin_unreachable();
}

const char *UFHDomain::zoneStatusToS(ZoneStatus status) {
    switch (status) {
    case ZoneStatus::Initializing:
        return "initializing";
    case ZoneStatus::Normal:
        return "normal";
    case ZoneStatus::Degraded:
        return "degraded";
    case ZoneStatus::FailSafe:
        return "fail_safe";
    }

    __builtin_unreachable();
}

const char *UFHDomain::controllerStatusToS(ControllerStatus status) {
    switch (status) {
    case ControllerStatus::Initializing:
        return "initializing";
    case ControllerStatus::Normal:
        return "normal";
    case ControllerStatus::Degraded:
        return "degraded";
    case ControllerStatus::FailSafe:
        return "fail_safe";
    }

    __builtin_unreachable();
}

const char *UFHDomain::healthTransitionToS(HealthTransition transition) {
    switch (transition) {
    case HealthTransition::None:
        return "none";
    case HealthTransition::Initialized:
        return "initialized";
    case HealthTransition::EnteredDegraded:
        return "entered_degraded";
    case HealthTransition::EnteredFailSafe:
        return "entered_fail_safe";
    case HealthTransition::Recovered:
        return "recovered";
    }

    __builtin_unreachable();
}

const char *UFHDomain::msgIDToS(MsgID id) {
    switch (id) {
    case MsgID::ZoneInputFailure:
        return "ZoneInputFailure";
    case MsgID::ZoneFailSafe:
        return "ZoneFailSafe";
    case MsgID::ControllerFailSafe:
        return "ControllerFailSafe";
    case MsgID::_Last:
        return "";
    }

    __builtin_unreachable();
}

const char *UFHDomain::configErrToS(ConfigErr err) {
    switch (err) {
    case ConfigErr::None:
        return "ok";
    case ConfigErr::Timing:
        return "timing values must be positive";
    case ConfigErr::MinRunTime:
        return "min run time must be shorter than the observation period";
    case ConfigErr::HealthTimeout:
        return "health timeouts must be positive";
    case ConfigErr::Threshold:
        return "thresholds must be within [0, 1]";
    case ConfigErr::NoZoneID:
        return "zone without id";
    case ConfigErr::DuplicateZoneID:
        return "duplicate zone id";
    case ConfigErr::SetpointLimits:
        return "setpoint limits out of order";
    case ConfigErr::IntegralLimits:
        return "integral limits out of order";
    case ConfigErr::EMATau:
        return "negative EMA time constant";
    case ConfigErr::PresetSetpoint:
        return "preset setpoint outside limits";
    }

    __builtin_unreachable();
}
