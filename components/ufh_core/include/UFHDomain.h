#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#define DEFAULT_OBSERVATION_PERIOD std::chrono::hours(2)
#define DEFAULT_MIN_RUN_TIME std::chrono::seconds(540)
#define DEFAULT_VALVE_OPEN_TIME std::chrono::seconds(210)
#define DEFAULT_CLOSING_WARNING std::chrono::seconds(240)
#define DEFAULT_WINDOW_BLOCK_TIME std::chrono::minutes(10)
#define DEFAULT_LOOP_INTERVAL std::chrono::minutes(1)
#define DEFAULT_FLUSH_DURATION std::chrono::minutes(8)

#define DEFAULT_INITIALIZING_TIMEOUT std::chrono::minutes(2)
#define DEFAULT_FAIL_SAFE_TIMEOUT std::chrono::hours(1)
#define DEFAULT_FAILURE_NOTIFICATION_THRESHOLD 3

#define DEFAULT_MAX_TICK_INTERVAL std::chrono::minutes(10)
#define DEFAULT_VALVE_OPEN_THRESHOLD 0.85
#define DEFAULT_WINDOW_OPEN_THRESHOLD 0.05
#define DEFAULT_EMA_TAU_S 600.0

#define CYCLE_MODE_HOURS 8

namespace UFHDomain {
typedef std::chrono::system_clock::time_point TimePoint;

enum class CircuitType { Regular, Flush };
enum class ValveState { On, Off, Unknown, Unavailable };
enum class ValveAction { TurnOn, TurnOff, StayOn, StayOff };
enum class OperationMode { Auto, Flush, Cycle, AllOn, AllOff, Disabled };
// Mode of the secondary (domestic hot water) heat source selector on the boiler
enum class SecondaryMode { Auto, Winter, Summer };
enum class ZoneStatus { Initializing, Normal, Degraded, FailSafe };
enum class ControllerStatus { Initializing, Normal, Degraded, FailSafe };
enum class HealthTransition { None, Initialized, EnteredDegraded, EnteredFailSafe, Recovered };

enum class MsgID {
    ZoneInputFailure,
    ZoneFailSafe,
    ControllerFailSafe,
    _Last,
};

enum class ConfigErr {
    None,
    Timing,
    MinRunTime,
    HealthTimeout,
    Threshold,
    NoZoneID,
    DuplicateZoneID,
    SetpointLimits,
    IntegralLimits,
    EMATau,
    PresetSetpoint,
};

struct TimingParams {
    std::chrono::seconds observationPeriod = DEFAULT_OBSERVATION_PERIOD;
    std::chrono::seconds minRunTime = DEFAULT_MIN_RUN_TIME;
    std::chrono::seconds valveOpenTime = DEFAULT_VALVE_OPEN_TIME;
    std::chrono::seconds closingWarning = DEFAULT_CLOSING_WARNING;
    std::chrono::seconds windowBlockTime = DEFAULT_WINDOW_BLOCK_TIME;
    std::chrono::seconds loopInterval = DEFAULT_LOOP_INTERVAL;
    std::chrono::seconds flushDuration = DEFAULT_FLUSH_DURATION;

    bool operator==(const TimingParams &) const = default;
};

struct HealthParams {
    std::chrono::seconds initializingTimeout = DEFAULT_INITIALIZING_TIMEOUT;
    std::chrono::seconds failSafeTimeout = DEFAULT_FAIL_SAFE_TIMEOUT;
    uint16_t failureNotificationThreshold = DEFAULT_FAILURE_NOTIFICATION_THRESHOLD;

    bool operator==(const HealthParams &) const = default;
};

// The integral limits bound the integral contribution in duty cycle percent
struct PIDGains {
    double kp = 50.0;
    double ki = 0.001;
    double kd = 0.0;
    double integralMin = 0.0;
    double integralMax = 100.0;

    bool operator==(const PIDGains &) const = default;
};

struct SetpointLimits {
    double minC = 16.0;
    double maxC = 28.0;
    double defaultC = 21.0;

    double clamp(double setpointC) const { return std::max(minC, std::min(setpointC, maxC)); }

    bool operator==(const SetpointLimits &) const = default;
};

struct Preset {
    std::string name;
    double setpointC;

    bool operator==(const Preset &) const = default;
};

std::vector<Preset> defaultPresets();

// Sensor and valve fields are opaque handles resolved by the zone IO and
// history store implementations.
struct ZoneConfig {
    std::string id;
    std::string name;
    std::string tempSensor;
    std::string valve;
    std::vector<std::string> windowSensors;
    CircuitType circuitType = CircuitType::Regular;
    SetpointLimits setpoint;
    PIDGains pid;
    double emaTauS = DEFAULT_EMA_TAU_S;
    std::vector<Preset> presets = defaultPresets();
};

struct ControllerConfig {
    std::string id;
    TimingParams timing;
    HealthParams health;
    double valveOpenThreshold = DEFAULT_VALVE_OPEN_THRESHOLD;
    double windowOpenThreshold = DEFAULT_WINDOW_OPEN_THRESHOLD;
    std::chrono::seconds maxTickInterval = DEFAULT_MAX_TICK_INTERVAL;
    std::vector<ZoneConfig> zones;
};

struct PIDState {
    double error;
    double pTerm;
    double iTerm;
    double dTerm;
    double dutyCycle;

    bool operator==(const PIDState &) const = default;
};

struct ZoneState {
    // NaN until the first reading
    double currentTempC = std::nan("");
    double displayTempC = std::nan("");
    double setpointC = 21.0;
    bool enabled = true;
    // Empty when the setpoint was set directly
    std::string presetMode;

    ValveState valveState = ValveState::Unknown;
    std::optional<PIDState> pid;

    double periodStateAvg = 0.0;
    double openStateAvg = 0.0;
    bool windowRecentlyOpen = false;
    double usedDurationS = 0.0;
    double requestedDurationS = 0.0;

    ZoneStatus status = ZoneStatus::Initializing;
    bool reachedNormal = false;
    uint16_t consecutiveFailures = 0;
    std::optional<TimePoint> lastSuccessfulUpdate;
    // Start of the current failure streak when there has never been a success
    std::optional<TimePoint> firstFailure;

    double remainingQuotaS() const { return requestedDurationS - usedDurationS; }
};

struct ControllerState {
    OperationMode mode = OperationMode::Auto;
    TimePoint observationStart;
    double periodElapsedS = 0.0;
    bool flushEnabled = false;
    bool dhwActive = false;
    std::optional<TimePoint> flushUntil;
    bool flushRequest = false;
    std::map<std::string, bool> zoneHeatRequests;

    // Last outputs issued, used to edge-trigger commands in auto mode
    std::optional<bool> lastHeatRequest;
    std::optional<SecondaryMode> lastSecondaryMode;
};

// Zones missing from valveActions must not be commanded this tick. An empty
// optional means the output must not be commanded either.
struct ControllerActions {
    std::map<std::string, ValveAction> valveActions;
    std::optional<bool> heatRequest;
    std::optional<SecondaryMode> secondaryMode;
};

struct ZoneSnapshot {
    std::string id;
    double setpointC;
    bool enabled;
    std::string presetMode;
    double tempC;
    double displayTempC;
    std::optional<PIDState> pid;
};

struct ControllerSnapshot {
    OperationMode mode;
    bool flushEnabled;
    std::vector<ZoneSnapshot> zones;
};

TimePoint getObservationStart(TimePoint now, std::chrono::seconds observationPeriod);
ConfigErr validateConfig(const ControllerConfig &config);

const char *circuitTypeToS(CircuitType type);
const char *valveStateToS(ValveState state);
const char *valveActionToS(ValveAction action);
const char *operationModeToS(OperationMode mode);
bool operationModeFromS(const char *str, OperationMode *mode);
const char *secondaryModeToS(SecondaryMode mode);
const char *zoneStatusToS(ZoneStatus status);
const char *controllerStatusToS(ControllerStatus status);
const char *healthTransitionToS(HealthTransition transition);
const char *msgIDToS(MsgID id);
const char *configErrToS(ConfigErr err);

// For testing
void PrintTo(const PIDState &state, std::ostream *os);
void PrintTo(ValveAction action, std::ostream *os);
void PrintTo(ZoneStatus status, std::ostream *os);
void PrintTo(ControllerStatus status, std::ostream *os);
void PrintTo(HealthTransition transition, std::ostream *os);

} // namespace UFHDomain
