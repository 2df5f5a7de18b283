#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string.h>

namespace zonewatch {

constexpr size_t kUuidLen = 16;
constexpr size_t kUuidTextLen = 37;  // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" + NUL

struct BeaconUuid {
  uint8_t bytes[kUuidLen] = {0};
};

inline bool operator==(const BeaconUuid& a, const BeaconUuid& b) {
  return memcmp(a.bytes, b.bytes, kUuidLen) == 0;
}
inline bool operator!=(const BeaconUuid& a, const BeaconUuid& b) { return !(a == b); }

// Accepts the canonical 8-4-4-4-12 form, any hex case. Returns false on
// anything else and leaves *out untouched.
bool parseUuid(const char* text, BeaconUuid* out);

// Upper-case canonical form into out (at least kUuidTextLen bytes).
void formatUuid(const BeaconUuid& uuid, char* out, size_t outLen);

struct BeaconIdentity {
  BeaconUuid uuid;
  uint16_t major = 0;
  uint16_t minor = 0;
};

inline bool operator==(const BeaconIdentity& a, const BeaconIdentity& b) {
  return a.major == b.major && a.minor == b.minor && a.uuid == b.uuid;
}
inline bool operator!=(const BeaconIdentity& a, const BeaconIdentity& b) { return !(a == b); }

// One decoded advertisement.
struct BeaconSighting {
  BeaconIdentity id;
  int rssi = 0;             // dBm
  int txPower = 0;          // measured power at 1 m, dBm
  double rawDistanceM = 0;  // unfiltered path-loss estimate
  uint32_t timestampMs = 0;
};

// The tracker's record for one identity. Copies of it are handed out;
// the live record never leaves the tracker.
struct TrackedBeacon {
  BeaconIdentity id;
  int rssi = 0;
  int txPower = 0;
  double distanceM = 0;     // smoothed, never negative
  uint32_t firstSeenMs = 0;
  uint32_t lastSeenMs = 0;
  uint32_t sightings = 0;
};

constexpr size_t kMaxTrackedBeacons = 32;

// Point-in-time copy of the tracker table.
struct BeaconSnapshot {
  TrackedBeacon beacons[kMaxTrackedBeacons];
  size_t count = 0;
  uint32_t takenAtMs = 0;
};

}  // namespace zonewatch
