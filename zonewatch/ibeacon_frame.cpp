#include "ibeacon_frame.h"

#include <math.h>
#include <string.h>

namespace zonewatch {

double estimateDistance(int rssi, int txPower) {
  if (rssi >= 0) return -1.0;
  if (txPower >= 0) txPower = kDefaultTxPowerDbm;

  const double ratio = static_cast<double>(rssi) / static_cast<double>(txPower);
  if (ratio < 1.0) {
    return pow(ratio, 10.0);
  }
  return 0.89976 * pow(ratio, 7.7095) + 0.111;
}

bool decodeIBeacon(const uint8_t* payload, size_t len, int rssi, uint32_t timestampMs,
                   BeaconSighting* out) {
  if (!payload || !out) return false;
  if (len != kIBeaconFrameLen) return false;

  const uint8_t* d = payload;
  if (d[0] != kAppleCompanyLo || d[1] != kAppleCompanyHi ||
      d[2] != kIBeaconType || d[3] != kIBeaconRemainingLen) {
    return false;
  }
  if (rssi >= 0) return false;

  BeaconSighting s;
  memcpy(s.id.uuid.bytes, d + 4, kUuidLen);
  s.id.major = static_cast<uint16_t>((d[20] << 8) | d[21]);
  s.id.minor = static_cast<uint16_t>((d[22] << 8) | d[23]);

  const int measured = static_cast<int8_t>(d[24]);
  s.txPower = (measured < 0) ? measured : kDefaultTxPowerDbm;
  s.rssi = rssi;
  s.rawDistanceM = estimateDistance(rssi, s.txPower);
  s.timestampMs = timestampMs;

  *out = s;
  return true;
}

}  // namespace zonewatch
