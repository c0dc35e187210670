#pragma once

#include <string>

#include "PIDAlgorithm.h"
#include "UFHDomain.h"

// Per-zone configuration, regulator and mutable state. Rebuilt whenever the
// controller is reconfigured.
class ZoneRuntime {
  public:
    explicit ZoneRuntime(const UFHDomain::ZoneConfig &config);

    const UFHDomain::ZoneConfig &config() const { return config_; }
    const std::string &id() const { return config_.id; }
    UFHDomain::ZoneState &state() { return state_; }
    const UFHDomain::ZoneState &state() const { return state_; }

    // Filters a raw reading into the control and display temperatures. A NaN
    // reading leaves both unchanged and returns false.
    bool updateTemperature(double rawC, double dtS);

    // Returns true if the PID state was recomputed
    bool updatePID(double dtS, bool paused);

    void updateDurations(const UFHDomain::TimingParams &timing, double periodElapsedS);

    void setSetpoint(double setpointC);
    bool applyPreset(const std::string &name);

    UFHDomain::ZoneSnapshot snapshot() const;
    void restore(const UFHDomain::ZoneSnapshot &snapshot);

  private:
    UFHDomain::ZoneConfig config_;
    PIDAlgorithm pid_;
    UFHDomain::ZoneState state_;
};
