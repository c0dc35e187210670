#include "HeatingController.h"

#include "ZoneHealth.h"
#include "ZoneScheduler.h"

#define ZONE_INPUT_FAILURE_MSG "Zone inputs failing, check sensors and history"
#define CONTROLLER_FAIL_SAFE_MSG "All zones in fail-safe, valves closed"

static const char *TAG = "UFH";

using CircuitType = UFHDomain::CircuitType;
using ConfigErr = UFHDomain::ConfigErr;
using ControllerStatus = UFHDomain::ControllerStatus;
using HealthTransition = UFHDomain::HealthTransition;
using MsgID = UFHDomain::MsgID;
using OperationMode = UFHDomain::OperationMode;
using SecondaryMode = UFHDomain::SecondaryMode;
using TimePoint = UFHDomain::TimePoint;
using ValveState = UFHDomain::ValveState;
using ZoneState = UFHDomain::ZoneState;
using ZoneStatus = UFHDomain::ZoneStatus;

ConfigErr HeatingController::configure(const UFHDomain::ControllerConfig &config) {
    ConfigErr err = UFHDomain::validateConfig(config);
    if (err != ConfigErr::None) {
        log_.err(TAG, "Rejecting configuration '%s': %s", config.id.c_str(),
                 UFHDomain::configErrToS(err));
        return err;
    }

    config_ = config;
    zones_.clear();
    for (const UFHDomain::ZoneConfig &zone : config_.zones) {
        zones_.push_back(std::make_unique<ZoneRuntime>(zone));
    }
    state_.zoneHeatRequests.clear();
    status_ = zones_.empty() ? ControllerStatus::Normal : ControllerStatus::Initializing;

    log_.info(TAG, "Configured '%s' with %zu zones", config_.id.c_str(), zones_.size());
    for (const UFHDomain::ZoneConfig &zone : config_.zones) {
        log_.info(TAG, "%s: %s circuit, valve %s", zone.id.c_str(),
                  UFHDomain::circuitTypeToS(zone.circuitType), zone.valve.c_str());
    }
    return ConfigErr::None;
}

void HeatingController::setMode(OperationMode mode) {
    if (mode == state_.mode) {
        return;
    }
    log_.info(TAG, "Mode %s -> %s", UFHDomain::operationModeToS(state_.mode),
              UFHDomain::operationModeToS(mode));
    state_.mode = mode;
}

ZoneRuntime *HeatingController::findZone(const std::string &zoneID) const {
    for (const std::unique_ptr<ZoneRuntime> &zone : zones_) {
        if (zone->id() == zoneID) {
            return zone.get();
        }
    }
    return nullptr;
}

const ZoneState *HeatingController::zoneState(const std::string &zoneID) const {
    ZoneRuntime *zone = findZone(zoneID);
    return zone ? &zone->state() : nullptr;
}

bool HeatingController::setZoneSetpoint(const std::string &zoneID, double setpointC) {
    ZoneRuntime *zone = findZone(zoneID);
    if (!zone) {
        log_.warn(TAG, "Setpoint for unknown zone '%s'", zoneID.c_str());
        return false;
    }
    zone->setSetpoint(setpointC);
    return true;
}

bool HeatingController::setZonePreset(const std::string &zoneID, const std::string &preset) {
    ZoneRuntime *zone = findZone(zoneID);
    if (!zone) {
        log_.warn(TAG, "Preset for unknown zone '%s'", zoneID.c_str());
        return false;
    }
    if (!zone->applyPreset(preset)) {
        log_.warn(TAG, "%s: unknown preset '%s'", zoneID.c_str(), preset.c_str());
        return false;
    }
    return true;
}

bool HeatingController::setZoneEnabled(const std::string &zoneID, bool enabled) {
    ZoneRuntime *zone = findZone(zoneID);
    if (!zone) {
        log_.warn(TAG, "Enable for unknown zone '%s'", zoneID.c_str());
        return false;
    }
    zone->state().enabled = enabled;
    return true;
}

UFHDomain::ControllerSnapshot HeatingController::snapshot() const {
    UFHDomain::ControllerSnapshot snapshot{
        .mode = state_.mode,
        .flushEnabled = state_.flushEnabled,
        .zones = {},
    };
    for (const std::unique_ptr<ZoneRuntime> &zone : zones_) {
        snapshot.zones.push_back(zone->snapshot());
    }
    return snapshot;
}

void HeatingController::restore(const UFHDomain::ControllerSnapshot &snapshot) {
    state_.mode = snapshot.mode;
    state_.flushEnabled = snapshot.flushEnabled;

    for (const UFHDomain::ZoneSnapshot &zoneSnapshot : snapshot.zones) {
        ZoneRuntime *zone = findZone(zoneSnapshot.id);
        if (!zone) {
            log_.warn(TAG, "Ignoring stored state for unknown zone '%s'", zoneSnapshot.id.c_str());
            continue;
        }
        zone->restore(zoneSnapshot);
    }

    log_.info(TAG, "Restored mode %s, flush %s", UFHDomain::operationModeToS(state_.mode),
              state_.flushEnabled ? "enabled" : "disabled");
}

UFHDomain::ControllerActions HeatingController::tick(TimePoint now, double dtS, bool dhwActive) {
    ControllerActions actions;
    if (state_.mode == OperationMode::Disabled) {
        return actions;
    }

    double maxDtS = config_.maxTickInterval.count();
    if (dtS > maxDtS) {
        log_.warn(TAG, "Tick interval %.0fs capped to %.0fs", dtS, maxDtS);
        dtS = maxDtS;
    }

    updateTiming(now, dhwActive);

    std::set<std::string> skipped;
    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        if (!refreshZone(*zone, now, dtS)) {
            skipped.insert(zone->id());
        }
    }
    updateStatus();

    switch (state_.mode) {
    case OperationMode::Auto:
        evaluateAuto(actions, now, skipped);
        break;
    case OperationMode::AllOn:
        setAll(actions, true);
        setOutputs(actions, true, SecondaryMode::Winter, false);
        break;
    case OperationMode::AllOff:
        setAll(actions, false);
        setOutputs(actions, false, SecondaryMode::Summer, false);
        break;
    case OperationMode::Flush:
        // Circulation only
        setAll(actions, true);
        setOutputs(actions, false, SecondaryMode::Summer, false);
        break;
    case OperationMode::Cycle:
        evaluateCycle(actions, now);
        setOutputs(actions, false, SecondaryMode::Summer, false);
        break;
    case OperationMode::Disabled:
        break;
    }

    if (state_.mode != OperationMode::Auto) {
        // Per zone requests only exist in auto mode
        for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
            state_.zoneHeatRequests[zone->id()] = false;
        }
    }

    applyFailSafe(actions);
    return actions;
}

void HeatingController::updateTiming(TimePoint now, bool dhwActive) {
    const UFHDomain::TimingParams &timing = config_.timing;

    state_.observationStart = UFHDomain::getObservationStart(now, timing.observationPeriod);
    state_.periodElapsedS = std::chrono::duration<double>(now - state_.observationStart).count();

    // Residual heat from the hot water cycle is flushed for a while after it ends
    if (state_.dhwActive && !dhwActive) {
        state_.flushUntil = now + timing.flushDuration;
        log_.info(TAG, "Hot water finished, flush window %llds",
                  static_cast<long long>(timing.flushDuration.count()));
    }
    state_.dhwActive = dhwActive;
}

double HeatingController::openStateAverage(ZoneRuntime &zone, TimePoint now) {
    const ZoneState &zs = zone.state();
    double avg;
    if (history_.getStateAverage(zone.config().valve, now - config_.timing.valveOpenTime, now,
                                 &avg)) {
        return avg;
    }

    log_.warn(TAG, "%s: valve open history unavailable, using valve state %s", zone.id().c_str(),
              UFHDomain::valveStateToS(zs.valveState));
    return zs.valveState == ValveState::On ? 1.0 : 0.0;
}

bool HeatingController::windowRecentlyOpen(ZoneRuntime &zone, TimePoint now) {
    for (const std::string &sensor : zone.config().windowSensors) {
        double avg;
        bool open;
        if (history_.getStateAverage(sensor, now - config_.timing.windowBlockTime, now, &avg)) {
            open = avg >= config_.windowOpenThreshold;
        } else {
            open = zoneIO_.getWindowOpen(sensor);
            log_.warn(TAG, "%s: window history unavailable for %s, currently %s",
                      zone.id().c_str(), sensor.c_str(), open ? "open" : "closed");
        }
        if (open) {
            return true;
        }
    }
    return false;
}

bool HeatingController::refreshZone(ZoneRuntime &zone, TimePoint now, double dtS) {
    const UFHDomain::ZoneConfig &cfg = zone.config();
    ZoneState &zs = zone.state();

    bool tempAvailable = zone.updateTemperature(zoneIO_.getTemperatureC(cfg.tempSensor), dtS);
    zs.valveState = zoneIO_.getValveState(cfg.valve);

    double periodAvg;
    bool historyOk = history_.getStateAverage(cfg.valve, state_.observationStart, now, &periodAvg);
    if (historyOk) {
        zs.periodStateAvg = periodAvg;
    } else {
        log_.warn(TAG, "%s: period history unavailable, holding valve", cfg.id.c_str());
    }
    zs.openStateAvg = openStateAverage(zone, now);
    zs.windowRecentlyOpen = windowRecentlyOpen(zone, now);

    bool paused = state_.mode != OperationMode::Auto || !zs.enabled || zs.windowRecentlyOpen ||
                  !tempAvailable;
    if (zone.updatePID(dtS, paused) && zs.pid) {
        log_.dbg(TAG, "%s: temp %0.2f setpoint %0.1f err %0.2f p %0.2f i %0.2f d %0.2f duty %0.1f",
                 cfg.id.c_str(), zs.currentTempC, zs.setpointC, zs.pid->error, zs.pid->pTerm,
                 zs.pid->iTerm, zs.pid->dTerm, zs.pid->dutyCycle);
    }
    zone.updateDurations(config_.timing, state_.periodElapsedS);
    log_.verbose(TAG, "%s: valve %s requested %.0fs used %.0fs open %.2f window %d",
                 cfg.id.c_str(), UFHDomain::valveStateToS(zs.valveState), zs.requestedDurationS,
                 zs.usedDurationS, zs.openStateAvg, zs.windowRecentlyOpen);

    HealthUpdate health = updateZoneHealth(zs, now, !tempAvailable, !historyOk,
                                           zs.valveState == ValveState::Unavailable,
                                           config_.health);
    switch (health.transition) {
    case HealthTransition::None:
        break;
    case HealthTransition::Initialized:
        log_.info(TAG, "%s: initialized", cfg.id.c_str());
        break;
    case HealthTransition::EnteredDegraded:
        log_.warn(TAG, "%s: degraded (temp %s, history %s, valve %s)", cfg.id.c_str(),
                  tempAvailable ? "ok" : "missing", historyOk ? "ok" : "failed",
                  UFHDomain::valveStateToS(zs.valveState));
        break;
    case HealthTransition::EnteredFailSafe:
        log_.err(TAG, "%s: fail-safe after %u failures, nothing good for over %llds",
                 cfg.id.c_str(), static_cast<unsigned>(zs.consecutiveFailures),
                 static_cast<long long>(health.timeoutUsed.count()));
        break;
    case HealthTransition::Recovered:
        log_.info(TAG, "%s: recovered", cfg.id.c_str());
        break;
    }

    return historyOk;
}

void HeatingController::updateStatus() {
    std::vector<ZoneStatus> statuses;
    std::string failSafeZones;
    bool inputsFailing = false;

    for (const std::unique_ptr<ZoneRuntime> &zone : zones_) {
        const ZoneState &zs = zone->state();
        statuses.push_back(zs.status);
        if (zs.status == ZoneStatus::FailSafe) {
            const std::string &name =
                zone->config().name.empty() ? zone->id() : zone->config().name;
            failSafeZones += (failSafeZones.empty() ? "" : ", ") + name;
        }
        if (zs.consecutiveFailures >= config_.health.failureNotificationThreshold) {
            inputsFailing = true;
        }
    }

    ControllerStatus status = aggregateControllerStatus(statuses);
    if (status != status_) {
        log_.log(status == ControllerStatus::FailSafe ? AbstractLogger::Error
                                                      : AbstractLogger::Info,
                 TAG, "Controller %s -> %s", UFHDomain::controllerStatusToS(status_),
                 UFHDomain::controllerStatusToS(status));
        status_ = status;
    }

    if (inputsFailing) {
        messageUI_.setMessage(MsgID::ZoneInputFailure, true, ZONE_INPUT_FAILURE_MSG);
    } else {
        messageUI_.clearMessage(MsgID::ZoneInputFailure);
    }

    if (!failSafeZones.empty()) {
        std::string msg = "Fail-safe: " + failSafeZones;
        messageUI_.setMessage(MsgID::ZoneFailSafe, false, msg.c_str());
    } else {
        messageUI_.clearMessage(MsgID::ZoneFailSafe);
    }

    if (status_ == ControllerStatus::FailSafe) {
        messageUI_.setMessage(MsgID::ControllerFailSafe, false, CONTROLLER_FAIL_SAFE_MSG);
    } else {
        messageUI_.clearMessage(MsgID::ControllerFailSafe);
    }
}

void HeatingController::evaluateAuto(ControllerActions &actions, TimePoint now,
                                     const std::set<std::string> &skipped) {
    const UFHDomain::TimingParams &timing = config_.timing;

    // Regular zones first, flush eligibility depends on their results this tick
    bool anyRegularOn = false;
    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        const ZoneState &zs = zone->state();
        if (zone->config().circuitType != CircuitType::Regular ||
            zs.status == ZoneStatus::FailSafe) {
            continue;
        }
        if (skipped.count(zone->id())) {
            anyRegularOn |= zs.valveState == ValveState::On;
            continue;
        }

        ValveAction action = ZoneScheduler::evaluateZone(zone->config(), zs, state_, timing);
        actions.valveActions[zone->id()] = action;
        anyRegularOn |= ZoneScheduler::isOn(action);
    }

    bool flushRequest = ZoneScheduler::computeFlushRequest(
        state_.flushEnabled, state_.dhwActive, state_.flushUntil, anyRegularOn, now);
    if (flushRequest != state_.flushRequest) {
        log_.info(TAG, "Flush request %s", flushRequest ? "on" : "off");
    }
    state_.flushRequest = flushRequest;

    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        const ZoneState &zs = zone->state();
        if (zone->config().circuitType != CircuitType::Flush ||
            zs.status == ZoneStatus::FailSafe || skipped.count(zone->id())) {
            continue;
        }
        actions.valveActions[zone->id()] =
            ZoneScheduler::evaluateZone(zone->config(), zs, state_, timing);
    }

    bool heatRequest = false;
    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        const ZoneState &zs = zone->state();
        bool request;
        if (zs.status == ZoneStatus::FailSafe) {
            request = false;
        } else if (skipped.count(zone->id())) {
            // Quota unknown this tick, keep the last request
            auto it = state_.zoneHeatRequests.find(zone->id());
            request = it != state_.zoneHeatRequests.end() && it->second;
        } else {
            request = ZoneScheduler::shouldRequestHeat(zs, timing, config_.valveOpenThreshold);
        }
        state_.zoneHeatRequests[zone->id()] = request;
        heatRequest |= request;
    }

    setOutputs(actions, heatRequest, heatRequest ? SecondaryMode::Winter : SecondaryMode::Summer,
               true);
}

void HeatingController::evaluateCycle(ControllerActions &actions, TimePoint now) {
    std::chrono::hours hourOfDay = std::chrono::duration_cast<std::chrono::hours>(
        now - std::chrono::floor<std::chrono::days>(now));
    int slot = hourOfDay.count() % CYCLE_MODE_HOURS;

    // Slot 0 is a rest hour with every valve closed
    int active = -1;
    if (slot != 0 && !zones_.empty()) {
        active = (slot - 1) % static_cast<int>(zones_.size());
    }

    for (int i = 0; i < static_cast<int>(zones_.size()); i++) {
        ValveState valve = zones_[i]->state().valveState;
        actions.valveActions[zones_[i]->id()] =
            i == active ? ZoneScheduler::onAction(valve) : ZoneScheduler::offAction(valve);
    }
}

void HeatingController::setAll(ControllerActions &actions, bool on) {
    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        ValveState valve = zone->state().valveState;
        actions.valveActions[zone->id()] =
            on ? ZoneScheduler::onAction(valve) : ZoneScheduler::offAction(valve);
    }
}

void HeatingController::setOutputs(ControllerActions &actions, bool heatRequest,
                                   SecondaryMode secondaryMode, bool onChangeOnly) {
    if (!onChangeOnly || state_.lastHeatRequest != heatRequest) {
        actions.heatRequest = heatRequest;
        state_.lastHeatRequest = heatRequest;
    }
    if (!onChangeOnly || state_.lastSecondaryMode != secondaryMode) {
        actions.secondaryMode = secondaryMode;
        state_.lastSecondaryMode = secondaryMode;
    }
}

void HeatingController::applyFailSafe(ControllerActions &actions) {
    for (std::unique_ptr<ZoneRuntime> &zone : zones_) {
        const ZoneState &zs = zone->state();
        if (zs.status == ZoneStatus::FailSafe) {
            actions.valveActions[zone->id()] = ZoneScheduler::offAction(zs.valveState);
            state_.zoneHeatRequests[zone->id()] = false;
        }
    }

    if (status_ != ControllerStatus::FailSafe) {
        return;
    }

    // Release the secondary mode override so the boiler falls back to its own control
    actions.heatRequest = false;
    actions.secondaryMode = SecondaryMode::Auto;
    state_.lastHeatRequest = false;
    state_.lastSecondaryMode = SecondaryMode::Auto;
}
