#pragma once

#include <stddef.h>
#include <stdint.h>

#include "beacon_tracker.h"
#include "beacon_types.h"
#include "clock.h"
#include "spin_lock.h"
#include "ticker.h"

namespace zonewatch {

// Evaluation ticker period. A first discovery requests one extra pass.
constexpr uint32_t kDefaultEvaluationIntervalMs = 10000;
constexpr double kDefaultExitMultiplier = 1.2;           // exit threshold = radius * 1.2
constexpr uint32_t kDefaultDwellMs = 10000;
constexpr uint32_t kDefaultStaleInsideTimeoutMs = 60000;  // last distance was inside the radius
constexpr uint32_t kDefaultStaleBandTimeoutMs = 30000;    // last distance was in the hysteresis band

constexpr size_t kMaxZones = 16;
constexpr size_t kMaxZoneListeners = 4;
constexpr size_t kZoneIdLen = 32;
constexpr size_t kZoneNameLen = 32;
constexpr int32_t kAnyId = -1;  // major/minor wildcard

struct MonitorConfig {
  uint32_t evaluationIntervalMs = kDefaultEvaluationIntervalMs;
  double exitMultiplier = kDefaultExitMultiplier;
  uint32_t dwellMs = kDefaultDwellMs;
  uint32_t staleInsideTimeoutMs = kDefaultStaleInsideTimeoutMs;
  uint32_t staleBandTimeoutMs = kDefaultStaleBandTimeoutMs;
};

struct ZoneConfig {
  char id[kZoneIdLen] = {0};
  char name[kZoneNameLen] = {0};
  BeaconUuid uuid;
  int32_t major = kAnyId;  // 0..65535 or kAnyId
  int32_t minor = kAnyId;
  double radiusM = 5.0;
  bool enabled = true;
};

// Fills a ZoneConfig from text. Returns false on a bad uuid or an id/name
// that does not fit.
bool makeZoneConfig(const char* id, const char* name, const char* uuid,
                    int32_t major, int32_t minor, double radiusM, bool enabled,
                    ZoneConfig* out);

bool zoneMatches(const ZoneConfig& zone, const BeaconIdentity& id);

enum class ZoneState : uint8_t { kUnknown, kOutside, kInside };
enum class ZoneEventKind : uint8_t { kEnter, kExit, kDwell };
enum class ExitReason : uint8_t { kNone, kDistance, kSignalLost, kStaleData };

const char* zoneStateName(ZoneState s);
const char* zoneEventName(ZoneEventKind k);
const char* exitReasonName(ExitReason r);

struct ZoneEvent {
  ZoneEventKind kind = ZoneEventKind::kEnter;
  char zoneId[kZoneIdLen] = {0};
  char zoneName[kZoneNameLen] = {0};
  TrackedBeacon beacon;   // driver at the time of the transition
  uint32_t timestampMs = 0;
  ExitReason reason = ExitReason::kNone;
};

struct ZoneStatus {
  char id[kZoneIdLen] = {0};
  char name[kZoneNameLen] = {0};
  ZoneState state = ZoneState::kUnknown;
  bool enabled = true;
  bool hasBeacon = false;
  double distanceM = 0;
  uint32_t enteredAtMs = 0;
  bool dwelling = false;  // INSIDE and DWELL already fired this episode
};

enum class ZoneResult : uint8_t { kOk, kInvalidConfig, kTableFull, kNotFound };

// Callbacks arrive on the evaluation task after the pass is done. Payloads
// are copies; zone state cannot be changed from here.
class ZoneListener {
 public:
  virtual ~ZoneListener() {}
  virtual void onZoneEvent(const ZoneEvent& event) = 0;
  virtual void onInsideAnyZoneChanged(bool inside) { (void)inside; }
};

// Matches tracker snapshots against configured zones and runs the
// ENTER / EXIT / DWELL state machine with hysteresis.
//
// evaluate() is the only mutator of zone runtime state and runs on the
// evaluation ticker. Registration and queries take the lock briefly and
// may come from any task.
class ZoneMonitor : public BeaconListener {
 public:
  ZoneMonitor(BeaconTracker& tracker, Ticker& evaluationTicker, const Clock& clock,
              const MonitorConfig& config = MonitorConfig());
  ~ZoneMonitor();

  // Adds a zone, or replaces the config of an existing id. Runtime state
  // survives a replace unless the uuid/major/minor pattern changed.
  ZoneResult registerZone(const ZoneConfig& config);
  bool unregisterZone(const char* id);
  ZoneResult setZoneEnabled(const char* id, bool enabled);
  void clearZones();

  // Governs the evaluation ticker only; the tracker lifecycle is the
  // caller's. Zone state is kept across stop/start.
  bool startMonitoring();
  void stopMonitoring();
  bool isMonitoring() const;

  // One evaluation pass against a fresh tracker snapshot.
  void evaluate(uint32_t nowMs);

  bool currentState(const char* id, ZoneState* out) const;
  bool zoneStatus(const char* id, ZoneStatus* out) const;
  size_t zoneStatuses(ZoneStatus* out, size_t max) const;
  size_t zoneCount() const;
  bool isInsideAnyZone() const;

  bool addListener(ZoneListener* listener);
  void removeListener(ZoneListener* listener);

  const MonitorConfig& config() const { return config_; }

  // BeaconListener, called on the radio task: only requests an early pass.
  void onDiscovered(const TrackedBeacon& beacon) override;

 private:
  struct Zone {
    bool used = false;
    ZoneConfig config;
    ZoneState state = ZoneState::kUnknown;
    bool hasDriver = false;
    TrackedBeacon driver;
    uint32_t enteredAtMs = 0;
    uint32_t lastConfirmedMs = 0;
    bool dwellFired = false;
  };

  static void evaluationTick(void* ctx);

  int findZoneLocked(const char* id) const;
  bool insideAnyLocked() const;
  void evaluateZoneLocked(Zone& zone, uint32_t nowMs);
  const TrackedBeacon* bestMatch(const Zone& zone) const;
  void queueEvent(const Zone& zone, ZoneEventKind kind, const TrackedBeacon& beacon,
                  uint32_t nowMs, ExitReason reason);
  void publishInsideAny(bool inside);
  size_t copyListeners(ZoneListener** out) const;

  BeaconTracker& tracker_;
  Ticker& ticker_;
  const Clock& clock_;
  MonitorConfig config_;

  mutable SpinLock lock_;
  bool monitoring_ = false;
  Zone zones_[kMaxZones];
  ZoneListener* listeners_[kMaxZoneListeners] = {nullptr};
  bool lastInsideAny_ = false;

  // Evaluation-task scratch. Only evaluate() touches these.
  BeaconSnapshot snapshot_;
  ZoneEvent pending_[kMaxZones];
  size_t pendingCount_ = 0;
};

}  // namespace zonewatch
