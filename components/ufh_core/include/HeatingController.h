#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "AbstractHistoryStore.h"
#include "AbstractLogger.h"
#include "AbstractMessageUI.h"
#include "AbstractZoneIO.h"
#include "UFHDomain.h"
#include "ZoneRuntime.h"

// Owns all zones of one boiler and turns each tick's readings into valve,
// heat request and secondary mode commands. Ticks must not run concurrently.
class HeatingController {
  public:
    HeatingController(AbstractZoneIO &zoneIO, AbstractHistoryStore &history,
                      AbstractMessageUI &messageUI, AbstractLogger &log)
        : zoneIO_(zoneIO), history_(history), messageUI_(messageUI), log_(log) {}

    // Rebuilds all zones. On error the previous configuration stays active.
    UFHDomain::ConfigErr configure(const UFHDomain::ControllerConfig &config);

    UFHDomain::ControllerActions tick(UFHDomain::TimePoint now, double dtS, bool dhwActive);

    void setMode(UFHDomain::OperationMode mode);
    UFHDomain::OperationMode mode() const { return state_.mode; }
    void setFlushEnabled(bool enabled) { state_.flushEnabled = enabled; }

    bool setZoneSetpoint(const std::string &zoneID, double setpointC);
    bool setZonePreset(const std::string &zoneID, const std::string &preset);
    bool setZoneEnabled(const std::string &zoneID, bool enabled);

    UFHDomain::ControllerStatus status() const { return status_; }
    const UFHDomain::ControllerState &state() const { return state_; }
    const UFHDomain::ControllerConfig &config() const { return config_; }
    // nullptr for an unknown zone
    const UFHDomain::ZoneState *zoneState(const std::string &zoneID) const;

    UFHDomain::ControllerSnapshot snapshot() const;
    void restore(const UFHDomain::ControllerSnapshot &snapshot);

  private:
    using ValveAction = UFHDomain::ValveAction;
    using ControllerActions = UFHDomain::ControllerActions;

    AbstractZoneIO &zoneIO_;
    AbstractHistoryStore &history_;
    AbstractMessageUI &messageUI_;
    AbstractLogger &log_;

    UFHDomain::ControllerConfig config_;
    UFHDomain::ControllerState state_;
    UFHDomain::ControllerStatus status_ = UFHDomain::ControllerStatus::Initializing;
    std::vector<std::unique_ptr<ZoneRuntime>> zones_;

    ZoneRuntime *findZone(const std::string &zoneID) const;

    void updateTiming(UFHDomain::TimePoint now, bool dhwActive);
    // Returns false if the zone's period history could not be read
    bool refreshZone(ZoneRuntime &zone, UFHDomain::TimePoint now, double dtS);
    double openStateAverage(ZoneRuntime &zone, UFHDomain::TimePoint now);
    bool windowRecentlyOpen(ZoneRuntime &zone, UFHDomain::TimePoint now);
    void updateStatus();

    void evaluateAuto(ControllerActions &actions, UFHDomain::TimePoint now,
                      const std::set<std::string> &skipped);
    void evaluateCycle(ControllerActions &actions, UFHDomain::TimePoint now);
    void setAll(ControllerActions &actions, bool on);
    void setOutputs(ControllerActions &actions, bool heatRequest,
                    UFHDomain::SecondaryMode secondaryMode, bool onChangeOnly);
    void applyFailSafe(ControllerActions &actions);
};
