#pragma once

#include <stddef.h>
#include <stdint.h>

#include "beacon_types.h"
#include "clock.h"
#include "distance_filter.h"
#include "radio.h"
#include "spin_lock.h"
#include "ticker.h"

namespace zonewatch {

constexpr uint32_t kDefaultBeaconTimeoutMs = 60000;  // long enough to ride out a paused advertiser
constexpr uint32_t kDefaultExpiryIntervalMs = 5000;
constexpr size_t kMaxUuidFilter = 8;
constexpr size_t kMaxBeaconListeners = 4;

struct TrackerConfig {
  uint32_t beaconTimeoutMs = kDefaultBeaconTimeoutMs;
  uint32_t expiryIntervalMs = kDefaultExpiryIntervalMs;
  FilterConfig filter;
};

struct TrackerStats {
  uint32_t framesReceived = 0;
  uint32_t beaconFrames = 0;      // decoded iBeacon frames
  uint32_t framesRejected = 0;    // wrong layout, dropped silently
  uint32_t framesFiltered = 0;    // UUID not in the allow-list
  uint32_t tableFullDrops = 0;    // new identity, no free slot
  uint32_t discovered = 0;
  uint32_t expired = 0;
};

// Pushed on first discovery only. Refreshes of a known beacon are visible
// through snapshot() and never notified, scan rates would flood listeners.
class BeaconListener {
 public:
  virtual ~BeaconListener() {}
  virtual void onDiscovered(const TrackedBeacon& beacon) = 0;
  virtual void onLost(const TrackedBeacon& beacon) { (void)beacon; }
};

// Turns raw advertisements into a filtered, expiring table of beacons.
//
// Frames arrive on the radio task, expiry runs on its own ticker task and
// snapshot() may be called from anywhere. The table lives behind a
// SpinLock and never leaves this class except as copies.
class BeaconTracker : public AdvertisementSink {
 public:
  BeaconTracker(Radio& radio, Ticker& expiryTicker, const Clock& clock,
                const TrackerConfig& config = TrackerConfig());
  ~BeaconTracker();

  // Starts the radio scan and the expiry ticker. Calling it while running
  // returns kOk. On failure the tracker stays stopped.
  ScanStatus start();

  // Stops both. No listener callback fires once this returns.
  void stop();

  bool isRunning() const;

  // Copies every tracked beacon into *out.
  void snapshot(BeaconSnapshot* out) const;

  // Drops every tracked beacon and its filter.
  void clear();

  // Removes beacons not refreshed within the timeout. Runs from the
  // expiry ticker; public so hosts and tests can force a pass.
  size_t expireStale(uint32_t nowMs);

  bool addListener(BeaconListener* listener);
  void removeListener(BeaconListener* listener);

  // Only sightings with one of these UUIDs are tracked. Empty accepts all.
  // Returns false if more than kMaxUuidFilter are given.
  bool setUuidFilter(const BeaconUuid* uuids, size_t count);

  TrackerStats stats() const;
  const TrackerConfig& config() const { return config_; }

  // AdvertisementSink
  void onAdvertisement(const uint8_t* payload, size_t len, int rssi, uint32_t timestampMs) override;

 private:
  struct Slot {
    bool used = false;
    TrackedBeacon beacon;
    DistanceFilter filter;
  };

  static void expiryTick(void* ctx);

  void handleSighting(const BeaconSighting& s);
  bool uuidAllowedLocked(const BeaconUuid& uuid) const;
  size_t copyListeners(BeaconListener** out) const;

  Radio& radio_;
  Ticker& expiryTicker_;
  const Clock& clock_;
  TrackerConfig config_;

  mutable SpinLock lock_;
  bool running_ = false;
  Slot slots_[kMaxTrackedBeacons];
  BeaconUuid uuidFilter_[kMaxUuidFilter];
  size_t uuidFilterCount_ = 0;
  BeaconListener* listeners_[kMaxBeaconListeners] = {nullptr};
  TrackerStats stats_;
};

}  // namespace zonewatch
