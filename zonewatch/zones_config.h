#pragma once

#include <stdint.h>

#include "zone_monitor.h"

// Site configuration, compiled in. Edit for your beacons.

namespace zonewatch {

struct ZoneSpec {
  const char* id;
  const char* name;
  const char* uuid;
  int32_t major;   // kAnyId = any
  int32_t minor;   // kAnyId = any
  double radiusM;
  bool enabled;
};

constexpr ZoneSpec kZones[] = {
  {"entrance", "Entrance",  "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 1, 100,    3.0, true},
  {"workshop", "Workshop",  "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 1, kAnyId, 8.0, true},
  {"storage",  "Storage",   "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 2, 300,    5.0, false},
};
constexpr size_t kZoneCount = sizeof(kZones) / sizeof(kZones[0]);

// LED (WS2812) on the C6 LCD board
constexpr int kRgbPin = 8;
constexpr uint16_t kRgbCount = 1;

// Scan tuning: 16/16 is a 100% duty cycle, lowest latency, highest power.
constexpr uint32_t kBleScanDurationS = 1;
constexpr uint16_t kBleScanInterval = 16;
constexpr uint16_t kBleScanWindow = 16;
constexpr uint32_t kBleScanLoopDelayMs = 5;

// Host side of the lifecycle
constexpr uint32_t kScanRetryMs = 5000;   // retry a failed tracker start
constexpr uint32_t kStatusLogMs = 10000;  // periodic stats / zone dump

}  // namespace zonewatch
