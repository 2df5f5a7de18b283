#include "zone_monitor.h"

#include <math.h>
#include <string.h>

#include "zw_log.h"

namespace zonewatch {

namespace {

const char* const TAG = "zones";

inline bool validWildcard(int32_t v) {
  return v == kAnyId || (v >= 0 && v <= 0xFFFF);
}

inline bool samePattern(const ZoneConfig& a, const ZoneConfig& b) {
  return a.uuid == b.uuid && a.major == b.major && a.minor == b.minor;
}

inline bool copyText(char* dst, size_t dstLen, const char* src) {
  if (!src) return false;
  const size_t n = strlen(src);
  if (n >= dstLen) return false;
  memcpy(dst, src, n + 1);
  return true;
}

}  // namespace

bool makeZoneConfig(const char* id, const char* name, const char* uuid,
                    int32_t major, int32_t minor, double radiusM, bool enabled,
                    ZoneConfig* out) {
  if (!out) return false;

  ZoneConfig cfg;
  if (!copyText(cfg.id, sizeof(cfg.id), id)) return false;
  if (!copyText(cfg.name, sizeof(cfg.name), name ? name : id)) return false;
  if (!parseUuid(uuid, &cfg.uuid)) return false;
  cfg.major = major;
  cfg.minor = minor;
  cfg.radiusM = radiusM;
  cfg.enabled = enabled;

  *out = cfg;
  return true;
}

bool zoneMatches(const ZoneConfig& zone, const BeaconIdentity& id) {
  if (zone.uuid != id.uuid) return false;
  if (zone.major != kAnyId && static_cast<int32_t>(id.major) != zone.major) return false;
  if (zone.minor != kAnyId && static_cast<int32_t>(id.minor) != zone.minor) return false;
  return true;
}

const char* zoneStateName(ZoneState s) {
  switch (s) {
    case ZoneState::kUnknown: return "UNKNOWN";
    case ZoneState::kOutside: return "OUTSIDE";
    case ZoneState::kInside:  return "INSIDE";
    default:                  return "?";
  }
}

const char* zoneEventName(ZoneEventKind k) {
  switch (k) {
    case ZoneEventKind::kEnter: return "ENTER";
    case ZoneEventKind::kExit:  return "EXIT";
    case ZoneEventKind::kDwell: return "DWELL";
    default:                    return "?";
  }
}

const char* exitReasonName(ExitReason r) {
  switch (r) {
    case ExitReason::kNone:       return "none";
    case ExitReason::kDistance:   return "distance";
    case ExitReason::kSignalLost: return "signal_lost";
    case ExitReason::kStaleData:  return "stale_data";
    default:                      return "?";
  }
}

ZoneMonitor::ZoneMonitor(BeaconTracker& tracker, Ticker& evaluationTicker, const Clock& clock,
                         const MonitorConfig& config)
    : tracker_(tracker), ticker_(evaluationTicker), clock_(clock), config_(config) {
  if (config_.evaluationIntervalMs == 0) config_.evaluationIntervalMs = kDefaultEvaluationIntervalMs;
  // A multiplier below 1 would put the exit threshold inside the radius.
  if (!(config_.exitMultiplier >= 1.0)) config_.exitMultiplier = 1.0;
  tracker_.addListener(this);
}

ZoneMonitor::~ZoneMonitor() {
  stopMonitoring();
  tracker_.removeListener(this);
}

ZoneResult ZoneMonitor::registerZone(const ZoneConfig& config) {
  ZoneConfig cfg = config;
  cfg.id[kZoneIdLen - 1] = '\0';
  cfg.name[kZoneNameLen - 1] = '\0';

  if (cfg.id[0] == '\0' || !(cfg.radiusM > 0.0) || isinf(cfg.radiusM) ||
      !validWildcard(cfg.major) || !validWildcard(cfg.minor)) {
    ZW_LOGW(TAG, "rejected zone '%s': invalid config", cfg.id);
    return ZoneResult::kInvalidConfig;
  }

  bool replaced = false;
  bool reset = false;
  bool changed = false;
  bool insideAny = false;
  {
    SpinLockGuard g(lock_);
    int idx = findZoneLocked(cfg.id);
    if (idx >= 0) {
      Zone& zone = zones_[idx];
      replaced = true;
      reset = !samePattern(zone.config, cfg);
      if (reset) {
        zone = Zone();
        zone.used = true;
      }
      zone.config = cfg;
    } else {
      for (size_t i = 0; i < kMaxZones; i++) {
        if (!zones_[i].used) {
          idx = static_cast<int>(i);
          break;
        }
      }
      if (idx < 0) return ZoneResult::kTableFull;
      zones_[idx] = Zone();
      zones_[idx].used = true;
      zones_[idx].config = cfg;
    }

    insideAny = insideAnyLocked();
    changed = insideAny != lastInsideAny_;
    lastInsideAny_ = insideAny;
  }

  char uuid[kUuidTextLen];
  formatUuid(cfg.uuid, uuid, sizeof(uuid));
  ZW_LOGI(TAG, "%s zone '%s' (%s) radius=%.2fm exit=%.2fm uuid=%s major=%ld minor=%ld%s%s",
          replaced ? "updated" : "added", cfg.name, cfg.id, cfg.radiusM,
          cfg.radiusM * config_.exitMultiplier, uuid,
          static_cast<long>(cfg.major), static_cast<long>(cfg.minor),
          cfg.enabled ? "" : " (disabled)", reset ? ", state reset" : "");

  if (changed) publishInsideAny(insideAny);
  return ZoneResult::kOk;
}

bool ZoneMonitor::unregisterZone(const char* id) {
  if (!id) return false;

  bool changed = false;
  bool insideAny = false;
  {
    SpinLockGuard g(lock_);
    const int idx = findZoneLocked(id);
    if (idx < 0) return false;
    zones_[idx] = Zone();

    insideAny = insideAnyLocked();
    changed = insideAny != lastInsideAny_;
    lastInsideAny_ = insideAny;
  }

  ZW_LOGI(TAG, "removed zone '%s'", id);
  if (changed) publishInsideAny(insideAny);
  return true;
}

ZoneResult ZoneMonitor::setZoneEnabled(const char* id, bool enabled) {
  if (!id) return ZoneResult::kNotFound;

  bool changed = false;
  bool insideAny = false;
  {
    SpinLockGuard g(lock_);
    const int idx = findZoneLocked(id);
    if (idx < 0) return ZoneResult::kNotFound;
    zones_[idx].config.enabled = enabled;

    insideAny = insideAnyLocked();
    changed = insideAny != lastInsideAny_;
    lastInsideAny_ = insideAny;
  }

  ZW_LOGI(TAG, "zone '%s' %s", id, enabled ? "enabled" : "disabled");
  if (changed) publishInsideAny(insideAny);
  return ZoneResult::kOk;
}

void ZoneMonitor::clearZones() {
  bool changed = false;
  {
    SpinLockGuard g(lock_);
    for (size_t i = 0; i < kMaxZones; i++) zones_[i] = Zone();
    changed = lastInsideAny_;
    lastInsideAny_ = false;
  }

  ZW_LOGI(TAG, "cleared all zones");
  if (changed) publishInsideAny(false);
}

bool ZoneMonitor::startMonitoring() {
  {
    SpinLockGuard g(lock_);
    if (monitoring_) return true;
    monitoring_ = true;
  }

  if (!ticker_.start(config_.evaluationIntervalMs, &ZoneMonitor::evaluationTick, this)) {
    {
      SpinLockGuard g(lock_);
      monitoring_ = false;
    }
    ZW_LOGE(TAG, "evaluation ticker start failed");
    return false;
  }

  ZW_LOGI(TAG, "monitoring started, %u zone(s), evaluating every %lums",
          static_cast<unsigned>(zoneCount()),
          static_cast<unsigned long>(config_.evaluationIntervalMs));
  return true;
}

void ZoneMonitor::stopMonitoring() {
  bool was;
  {
    SpinLockGuard g(lock_);
    was = monitoring_;
    monitoring_ = false;
  }

  ticker_.stop();
  if (was) ZW_LOGI(TAG, "monitoring stopped, zone state kept");
}

bool ZoneMonitor::isMonitoring() const {
  SpinLockGuard g(lock_);
  return monitoring_;
}

void ZoneMonitor::evaluate(uint32_t nowMs) {
  // One snapshot per pass, so every zone sees the same instant.
  tracker_.snapshot(&snapshot_);
  pendingCount_ = 0;

  bool changed = false;
  bool insideAny = false;
  {
    SpinLockGuard g(lock_);
    for (size_t i = 0; i < kMaxZones; i++) {
      Zone& zone = zones_[i];
      if (!zone.used || !zone.config.enabled) continue;
      evaluateZoneLocked(zone, nowMs);
    }

    insideAny = insideAnyLocked();
    changed = insideAny != lastInsideAny_;
    lastInsideAny_ = insideAny;
  }

  ZoneListener* ls[kMaxZoneListeners];
  const size_t n = copyListeners(ls);

  for (size_t i = 0; i < pendingCount_; i++) {
    const ZoneEvent& ev = pending_[i];
    if (ev.kind == ZoneEventKind::kExit) {
      ZW_LOGI(TAG, "EXIT '%s' reason=%s dist=%.2fm age=%lums", ev.zoneName,
              exitReasonName(ev.reason), ev.beacon.distanceM,
              static_cast<unsigned long>(elapsedMs(nowMs, ev.beacon.lastSeenMs)));
    } else {
      ZW_LOGI(TAG, "%s '%s' dist=%.2fm rssi=%d", zoneEventName(ev.kind), ev.zoneName,
              ev.beacon.distanceM, ev.beacon.rssi);
    }
    for (size_t k = 0; k < n; k++) ls[k]->onZoneEvent(ev);
  }

  if (changed) publishInsideAny(insideAny);
}

void ZoneMonitor::evaluateZoneLocked(Zone& zone, uint32_t nowMs) {
  const TrackedBeacon* best = bestMatch(zone);

  if (!best) {
    // Expired from the tracker. A lost signal counts as leaving.
    if (zone.state == ZoneState::kInside) {
      zone.state = ZoneState::kOutside;
      zone.dwellFired = false;
      queueEvent(zone, ZoneEventKind::kExit, zone.driver, nowMs, ExitReason::kSignalLost);
    }
    zone.hasDriver = false;
    return;
  }

  zone.driver = *best;
  zone.hasDriver = true;
  zone.lastConfirmedMs = best->lastSeenMs;

  const double d = best->distanceM;
  const double radius = zone.config.radiusM;
  const double exitThreshold = radius * config_.exitMultiplier;

  switch (zone.state) {
    case ZoneState::kUnknown:
    case ZoneState::kOutside:
      if (d <= radius) {
        zone.state = ZoneState::kInside;
        zone.enteredAtMs = nowMs;
        zone.dwellFired = false;
        queueEvent(zone, ZoneEventKind::kEnter, *best, nowMs, ExitReason::kNone);
      } else {
        zone.state = ZoneState::kOutside;
      }
      break;

    case ZoneState::kInside: {
      if (d > exitThreshold) {
        zone.state = ZoneState::kOutside;
        zone.dwellFired = false;
        queueEvent(zone, ZoneEventKind::kExit, *best, nowMs, ExitReason::kDistance);
        break;
      }

      // Between radius and exit threshold the state holds. A driver that
      // stopped reporting is given less time there than deep inside.
      const uint32_t timeout = (d <= radius) ? config_.staleInsideTimeoutMs
                                             : config_.staleBandTimeoutMs;
      if (elapsedMs(nowMs, best->lastSeenMs) > timeout) {
        zone.state = ZoneState::kOutside;
        zone.dwellFired = false;
        queueEvent(zone, ZoneEventKind::kExit, *best, nowMs, ExitReason::kStaleData);
        break;
      }

      if (!zone.dwellFired && elapsedMs(nowMs, zone.enteredAtMs) >= config_.dwellMs) {
        zone.dwellFired = true;
        queueEvent(zone, ZoneEventKind::kDwell, *best, nowMs, ExitReason::kNone);
      }
      break;
    }
  }
}

const TrackedBeacon* ZoneMonitor::bestMatch(const Zone& zone) const {
  const TrackedBeacon* best = nullptr;
  for (size_t i = 0; i < snapshot_.count; i++) {
    const TrackedBeacon& b = snapshot_.beacons[i];
    if (!zoneMatches(zone.config, b.id)) continue;

    if (!best || b.distanceM < best->distanceM) {
      best = &b;
    } else if (b.distanceM == best->distanceM && zone.hasDriver && b.id == zone.driver.id) {
      // Tie: keep the current driver.
      best = &b;
    }
  }
  return best;
}

void ZoneMonitor::queueEvent(const Zone& zone, ZoneEventKind kind, const TrackedBeacon& beacon,
                             uint32_t nowMs, ExitReason reason) {
  if (pendingCount_ >= kMaxZones) return;
  ZoneEvent& ev = pending_[pendingCount_++];
  ev.kind = kind;
  memcpy(ev.zoneId, zone.config.id, kZoneIdLen);
  memcpy(ev.zoneName, zone.config.name, kZoneNameLen);
  ev.beacon = beacon;
  ev.timestampMs = nowMs;
  ev.reason = reason;
}

bool ZoneMonitor::currentState(const char* id, ZoneState* out) const {
  if (!id || !out) return false;
  SpinLockGuard g(lock_);
  const int idx = findZoneLocked(id);
  if (idx < 0) return false;
  *out = zones_[idx].state;
  return true;
}

bool ZoneMonitor::zoneStatus(const char* id, ZoneStatus* out) const {
  if (!id || !out) return false;
  SpinLockGuard g(lock_);
  const int idx = findZoneLocked(id);
  if (idx < 0) return false;

  const Zone& zone = zones_[idx];
  memcpy(out->id, zone.config.id, kZoneIdLen);
  memcpy(out->name, zone.config.name, kZoneNameLen);
  out->state = zone.state;
  out->enabled = zone.config.enabled;
  out->hasBeacon = zone.hasDriver;
  out->distanceM = zone.hasDriver ? zone.driver.distanceM : 0.0;
  out->enteredAtMs = zone.enteredAtMs;
  out->dwelling = zone.state == ZoneState::kInside && zone.dwellFired;
  return true;
}

size_t ZoneMonitor::zoneStatuses(ZoneStatus* out, size_t max) const {
  if (!out) return 0;
  size_t n = 0;
  SpinLockGuard g(lock_);
  for (size_t i = 0; i < kMaxZones && n < max; i++) {
    const Zone& zone = zones_[i];
    if (!zone.used) continue;
    ZoneStatus& st = out[n++];
    memcpy(st.id, zone.config.id, kZoneIdLen);
    memcpy(st.name, zone.config.name, kZoneNameLen);
    st.state = zone.state;
    st.enabled = zone.config.enabled;
    st.hasBeacon = zone.hasDriver;
    st.distanceM = zone.hasDriver ? zone.driver.distanceM : 0.0;
    st.enteredAtMs = zone.enteredAtMs;
    st.dwelling = zone.state == ZoneState::kInside && zone.dwellFired;
  }
  return n;
}

size_t ZoneMonitor::zoneCount() const {
  SpinLockGuard g(lock_);
  size_t n = 0;
  for (size_t i = 0; i < kMaxZones; i++) {
    if (zones_[i].used) n++;
  }
  return n;
}

bool ZoneMonitor::isInsideAnyZone() const {
  SpinLockGuard g(lock_);
  return insideAnyLocked();
}

bool ZoneMonitor::addListener(ZoneListener* listener) {
  if (!listener) return false;
  SpinLockGuard g(lock_);
  int freeIdx = -1;
  for (size_t i = 0; i < kMaxZoneListeners; i++) {
    if (listeners_[i] == listener) return true;
    if (!listeners_[i] && freeIdx < 0) freeIdx = static_cast<int>(i);
  }
  if (freeIdx < 0) return false;
  listeners_[freeIdx] = listener;
  return true;
}

void ZoneMonitor::removeListener(ZoneListener* listener) {
  SpinLockGuard g(lock_);
  for (size_t i = 0; i < kMaxZoneListeners; i++) {
    if (listeners_[i] == listener) listeners_[i] = nullptr;
  }
}

void ZoneMonitor::onDiscovered(const TrackedBeacon& beacon) {
  (void)beacon;
  if (isMonitoring()) ticker_.triggerNow();
}

int ZoneMonitor::findZoneLocked(const char* id) const {
  for (size_t i = 0; i < kMaxZones; i++) {
    if (zones_[i].used && strncmp(zones_[i].config.id, id, kZoneIdLen) == 0) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool ZoneMonitor::insideAnyLocked() const {
  for (size_t i = 0; i < kMaxZones; i++) {
    const Zone& zone = zones_[i];
    if (zone.used && zone.config.enabled && zone.state == ZoneState::kInside) return true;
  }
  return false;
}

void ZoneMonitor::publishInsideAny(bool inside) {
  ZW_LOGI(TAG, "inside any zone: %s", inside ? "yes" : "no");
  ZoneListener* ls[kMaxZoneListeners];
  const size_t n = copyListeners(ls);
  for (size_t k = 0; k < n; k++) ls[k]->onInsideAnyZoneChanged(inside);
}

size_t ZoneMonitor::copyListeners(ZoneListener** out) const {
  SpinLockGuard g(lock_);
  size_t n = 0;
  for (size_t i = 0; i < kMaxZoneListeners; i++) {
    if (listeners_[i]) out[n++] = listeners_[i];
  }
  return n;
}

void ZoneMonitor::evaluationTick(void* ctx) {
  ZoneMonitor* self = static_cast<ZoneMonitor*>(ctx);
  self->evaluate(self->clock_.nowMs());
}

}  // namespace zonewatch
