#include "ZoneRuntime.h"

#include <cmath>

#include "TemperatureFilter.h"
#include "ZoneScheduler.h"

ZoneRuntime::ZoneRuntime(const UFHDomain::ZoneConfig &config)
    : config_(config), pid_(config.pid) {
    state_.setpointC = config_.setpoint.defaultC;
}

bool ZoneRuntime::updateTemperature(double rawC, double dtS) {
    if (std::isnan(rawC)) {
        return false;
    }

    state_.currentTempC = emaFilter(rawC, state_.currentTempC, config_.emaTauS, dtS);
    state_.displayTempC = roundForDisplay(state_.currentTempC, state_.displayTempC);
    return true;
}

bool ZoneRuntime::updatePID(double dtS, bool paused) {
    if (paused || std::isnan(state_.currentTempC)) {
        return false;
    }

    state_.pid = pid_.update(state_.pid, state_.setpointC, state_.currentTempC, dtS);
    return true;
}

void ZoneRuntime::updateDurations(const UFHDomain::TimingParams &timing, double periodElapsedS) {
    state_.requestedDurationS =
        ZoneScheduler::requestedDuration(state_.pid, timing.observationPeriod);
    state_.usedDurationS = ZoneScheduler::usedDuration(state_.periodStateAvg, periodElapsedS,
                                                       timing.observationPeriod);
}

void ZoneRuntime::setSetpoint(double setpointC) {
    state_.setpointC = config_.setpoint.clamp(setpointC);
    state_.presetMode.clear();
}

bool ZoneRuntime::applyPreset(const std::string &name) {
    for (const UFHDomain::Preset &preset : config_.presets) {
        if (preset.name == name) {
            state_.setpointC = config_.setpoint.clamp(preset.setpointC);
            state_.presetMode = name;
            return true;
        }
    }
    return false;
}

UFHDomain::ZoneSnapshot ZoneRuntime::snapshot() const {
    return UFHDomain::ZoneSnapshot{
        .id = config_.id,
        .setpointC = state_.setpointC,
        .enabled = state_.enabled,
        .presetMode = state_.presetMode,
        .tempC = state_.currentTempC,
        .displayTempC = state_.displayTempC,
        .pid = state_.pid,
    };
}

void ZoneRuntime::restore(const UFHDomain::ZoneSnapshot &snapshot) {
    state_.setpointC = config_.setpoint.clamp(snapshot.setpointC);
    state_.enabled = snapshot.enabled;
    state_.presetMode = snapshot.presetMode;
    state_.currentTempC = snapshot.tempC;
    state_.displayTempC = snapshot.displayTempC;
    if (snapshot.pid) {
        state_.pid = pid_.restore(*snapshot.pid);
    } else {
        state_.pid.reset();
    }
}
