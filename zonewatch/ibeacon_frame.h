#pragma once

#include <stddef.h>
#include <stdint.h>

#include "beacon_types.h"

namespace zonewatch {

// iBeacon manufacturer data, as NimBLE hands it over (company id included):
//   4C 00 | 02 15 | uuid[16] | major[2] BE | minor[2] BE | measured power (int8)
constexpr size_t kIBeaconFrameLen = 25;
constexpr uint8_t kAppleCompanyLo = 0x4C;
constexpr uint8_t kAppleCompanyHi = 0x00;
constexpr uint8_t kIBeaconType = 0x02;
constexpr uint8_t kIBeaconRemainingLen = 0x15;

// Reference power used when a frame advertises a non-negative value.
constexpr int kDefaultTxPowerDbm = -59;

// Decodes one frame. Only the exact 25-byte layout is accepted; anything
// else, or a non-negative RSSI (no reading), returns false without touching *out.
bool decodeIBeacon(const uint8_t* payload, size_t len, int rssi, uint32_t timestampMs,
                   BeaconSighting* out);

// Path-loss ratio model (meters):
//   ratio = rssi / txPower
//   ratio < 1  -> ratio^10
//   otherwise  -> 0.89976 * ratio^7.7095 + 0.111
// Returns a negative value when rssi is not a reading (>= 0).
double estimateDistance(int rssi, int txPower);

}  // namespace zonewatch
