#include "beacon_tracker.h"

#include "ibeacon_frame.h"
#include "zw_log.h"

namespace zonewatch {

namespace {

const char* const TAG = "tracker";

void logBeacon(const char* what, const TrackedBeacon& b) {
  char uuid[kUuidTextLen];
  formatUuid(b.id.uuid, uuid, sizeof(uuid));
  ZW_LOGI(TAG, "%s %s major=%u minor=%u rssi=%d dist=%.2fm", what, uuid,
          static_cast<unsigned>(b.id.major), static_cast<unsigned>(b.id.minor),
          b.rssi, b.distanceM);
}

}  // namespace

BeaconTracker::BeaconTracker(Radio& radio, Ticker& expiryTicker, const Clock& clock,
                             const TrackerConfig& config)
    : radio_(radio), expiryTicker_(expiryTicker), clock_(clock), config_(config) {
  if (config_.expiryIntervalMs == 0) config_.expiryIntervalMs = kDefaultExpiryIntervalMs;
}

BeaconTracker::~BeaconTracker() {
  stop();
}

ScanStatus BeaconTracker::start() {
  {
    SpinLockGuard g(lock_);
    if (running_) return ScanStatus::kOk;
    running_ = true;
  }

  const ScanStatus radioStatus = radio_.startScan(this);
  if (radioStatus != ScanStatus::kOk) {
    {
      SpinLockGuard g(lock_);
      running_ = false;
    }
    ZW_LOGE(TAG, "scan start failed: %s", scanStatusName(radioStatus));
    return radioStatus;
  }

  if (!expiryTicker_.start(config_.expiryIntervalMs, &BeaconTracker::expiryTick, this)) {
    radio_.stopScan();
    {
      SpinLockGuard g(lock_);
      running_ = false;
    }
    ZW_LOGE(TAG, "expiry ticker start failed");
    return ScanStatus::kTaskFailed;
  }

  ZW_LOGI(TAG, "started, timeout=%lums expiry every %lums",
          static_cast<unsigned long>(config_.beaconTimeoutMs),
          static_cast<unsigned long>(config_.expiryIntervalMs));
  return ScanStatus::kOk;
}

void BeaconTracker::stop() {
  bool wasRunning;
  {
    SpinLockGuard g(lock_);
    wasRunning = running_;
    running_ = false;
  }

  // Both block until their task is out of our callbacks.
  radio_.stopScan();
  expiryTicker_.stop();

  if (wasRunning) {
    const TrackerStats s = stats();
    ZW_LOGI(TAG, "stopped, frames=%lu beacons=%lu rejected=%lu",
            static_cast<unsigned long>(s.framesReceived),
            static_cast<unsigned long>(s.beaconFrames),
            static_cast<unsigned long>(s.framesRejected));
  }
}

bool BeaconTracker::isRunning() const {
  SpinLockGuard g(lock_);
  return running_;
}

void BeaconTracker::snapshot(BeaconSnapshot* out) const {
  if (!out) return;
  out->count = 0;
  out->takenAtMs = clock_.nowMs();

  SpinLockGuard g(lock_);
  for (size_t i = 0; i < kMaxTrackedBeacons; i++) {
    if (!slots_[i].used) continue;
    out->beacons[out->count++] = slots_[i].beacon;
  }
}

void BeaconTracker::clear() {
  SpinLockGuard g(lock_);
  for (size_t i = 0; i < kMaxTrackedBeacons; i++) {
    slots_[i].used = false;
    slots_[i].filter.reset();
  }
}

size_t BeaconTracker::expireStale(uint32_t nowMs) {
  size_t removed = 0;

  // One slot per lock so onLost() runs unlocked.
  for (size_t i = 0; i < kMaxTrackedBeacons; i++) {
    TrackedBeacon lost;
    bool hit = false;
    {
      SpinLockGuard g(lock_);
      Slot& slot = slots_[i];
      if (slot.used && elapsedMs(nowMs, slot.beacon.lastSeenMs) > config_.beaconTimeoutMs) {
        lost = slot.beacon;
        slot.used = false;
        slot.filter.reset();
        stats_.expired++;
        hit = true;
      }
    }
    if (!hit) continue;

    removed++;
    logBeacon("lost", lost);

    BeaconListener* ls[kMaxBeaconListeners];
    const size_t n = copyListeners(ls);
    for (size_t k = 0; k < n; k++) ls[k]->onLost(lost);
  }
  return removed;
}

bool BeaconTracker::addListener(BeaconListener* listener) {
  if (!listener) return false;
  SpinLockGuard g(lock_);
  int freeIdx = -1;
  for (size_t i = 0; i < kMaxBeaconListeners; i++) {
    if (listeners_[i] == listener) return true;
    if (!listeners_[i] && freeIdx < 0) freeIdx = static_cast<int>(i);
  }
  if (freeIdx < 0) return false;
  listeners_[freeIdx] = listener;
  return true;
}

void BeaconTracker::removeListener(BeaconListener* listener) {
  SpinLockGuard g(lock_);
  for (size_t i = 0; i < kMaxBeaconListeners; i++) {
    if (listeners_[i] == listener) listeners_[i] = nullptr;
  }
}

bool BeaconTracker::setUuidFilter(const BeaconUuid* uuids, size_t count) {
  if (count > kMaxUuidFilter) return false;
  if (count > 0 && !uuids) return false;

  {
    SpinLockGuard g(lock_);
    for (size_t i = 0; i < count; i++) uuidFilter_[i] = uuids[i];
    uuidFilterCount_ = count;
  }

  if (count == 0) {
    ZW_LOGI(TAG, "uuid filter cleared, tracking all beacons");
  } else {
    ZW_LOGI(TAG, "uuid filter set, %u uuid(s)", static_cast<unsigned>(count));
  }
  return true;
}

TrackerStats BeaconTracker::stats() const {
  SpinLockGuard g(lock_);
  return stats_;
}

void BeaconTracker::onAdvertisement(const uint8_t* payload, size_t len, int rssi,
                                    uint32_t timestampMs) {
  {
    SpinLockGuard g(lock_);
    if (!running_) return;
    stats_.framesReceived++;
  }

  BeaconSighting s;
  if (!decodeIBeacon(payload, len, rssi, timestampMs, &s)) {
    SpinLockGuard g(lock_);
    stats_.framesRejected++;
    return;
  }
  handleSighting(s);
}

void BeaconTracker::handleSighting(const BeaconSighting& s) {
  TrackedBeacon discovered;
  bool isNew = false;
  bool tableFull = false;
  {
    SpinLockGuard g(lock_);
    stats_.beaconFrames++;
    if (!uuidAllowedLocked(s.id.uuid)) {
      stats_.framesFiltered++;
      return;
    }

    int freeIdx = -1;
    int matchIdx = -1;
    for (size_t i = 0; i < kMaxTrackedBeacons; i++) {
      if (!slots_[i].used) {
        if (freeIdx < 0) freeIdx = static_cast<int>(i);
        continue;
      }
      if (slots_[i].beacon.id == s.id) {
        matchIdx = static_cast<int>(i);
        break;
      }
    }

    if (matchIdx >= 0) {
      Slot& slot = slots_[matchIdx];
      slot.beacon.distanceM = slot.filter.update(s.rawDistanceM);
      slot.beacon.rssi = s.rssi;
      slot.beacon.txPower = s.txPower;
      slot.beacon.lastSeenMs = s.timestampMs;
      slot.beacon.sightings++;
    } else if (freeIdx >= 0) {
      Slot& slot = slots_[freeIdx];
      slot.used = true;
      slot.filter = DistanceFilter(config_.filter);
      slot.beacon.id = s.id;
      slot.beacon.distanceM = slot.filter.update(s.rawDistanceM);
      slot.beacon.rssi = s.rssi;
      slot.beacon.txPower = s.txPower;
      slot.beacon.firstSeenMs = s.timestampMs;
      slot.beacon.lastSeenMs = s.timestampMs;
      slot.beacon.sightings = 1;
      stats_.discovered++;
      discovered = slot.beacon;
      isNew = true;
    } else {
      stats_.tableFullDrops++;
      tableFull = stats_.tableFullDrops == 1;
    }
  }

  if (tableFull) {
    ZW_LOGW(TAG, "beacon table full (%u), dropping new identities",
            static_cast<unsigned>(kMaxTrackedBeacons));
  }
  if (!isNew) return;

  logBeacon("discovered", discovered);

  BeaconListener* ls[kMaxBeaconListeners];
  const size_t n = copyListeners(ls);
  for (size_t k = 0; k < n; k++) ls[k]->onDiscovered(discovered);
}

bool BeaconTracker::uuidAllowedLocked(const BeaconUuid& uuid) const {
  if (uuidFilterCount_ == 0) return true;
  for (size_t i = 0; i < uuidFilterCount_; i++) {
    if (uuidFilter_[i] == uuid) return true;
  }
  return false;
}

size_t BeaconTracker::copyListeners(BeaconListener** out) const {
  SpinLockGuard g(lock_);
  size_t n = 0;
  for (size_t i = 0; i < kMaxBeaconListeners; i++) {
    if (listeners_[i]) out[n++] = listeners_[i];
  }
  return n;
}

void BeaconTracker::expiryTick(void* ctx) {
  BeaconTracker* self = static_cast<BeaconTracker*>(ctx);
  self->expireStale(self->clock_.nowMs());
}

}  // namespace zonewatch
