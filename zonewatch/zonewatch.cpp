#include "zonewatch.h"

#include <Arduino.h>

#include "arduino_clock.h"
#include "beacon_tracker.h"
#include "freertos_ticker.h"
#include "nimble_radio.h"
#include "zone_indicator.h"
#include "zone_monitor.h"
#include "zones_config.h"
#include "zw_log.h"

using namespace zonewatch;

namespace {

const char* const TAG = "app";

NimbleScanSettings scanSettings() {
  NimbleScanSettings s;
  s.scanDurationS = kBleScanDurationS;
  s.interval = kBleScanInterval;
  s.window = kBleScanWindow;
  s.loopDelayMs = kBleScanLoopDelayMs;
  return s;
}

ArduinoClock g_clock;
NimbleRadio g_radio(scanSettings());
FreeRtosTicker g_expiryTicker("zw_expiry", 3072, 1, 1);
FreeRtosTicker g_evalTicker("zw_eval", 4096, 1, 1);
BeaconTracker g_tracker(g_radio, g_expiryTicker, g_clock);
ZoneMonitor g_monitor(g_tracker, g_evalTicker, g_clock);
ZoneIndicator g_indicator(g_monitor, kRgbPin, kRgbCount);

bool g_scanning = false;
uint32_t g_lastScanAttemptMs = 0;
uint32_t g_lastStatusMs = 0;

ZoneStatus g_statuses[kMaxZones];

void registerConfiguredZones() {
  BeaconUuid uuids[kMaxUuidFilter];
  size_t uuidCount = 0;

  for (size_t i = 0; i < kZoneCount; i++) {
    const ZoneSpec& spec = kZones[i];
    ZoneConfig cfg;
    if (!makeZoneConfig(spec.id, spec.name, spec.uuid, spec.major, spec.minor,
                        spec.radiusM, spec.enabled, &cfg)) {
      ZW_LOGE(TAG, "bad zone entry '%s', skipped", spec.id);
      continue;
    }
    const ZoneResult r = g_monitor.registerZone(cfg);
    if (r != ZoneResult::kOk) {
      ZW_LOGE(TAG, "zone '%s' not registered (%d)", spec.id, static_cast<int>(r));
      continue;
    }
    if (!cfg.enabled) continue;

    // Only track UUIDs some enabled zone cares about.
    bool known = false;
    for (size_t k = 0; k < uuidCount; k++) {
      if (uuids[k] == cfg.uuid) known = true;
    }
    if (!known && uuidCount < kMaxUuidFilter) uuids[uuidCount++] = cfg.uuid;
  }

  g_tracker.setUuidFilter(uuids, uuidCount);
}

void tryStartScan() {
  g_lastScanAttemptMs = millis();
  const ScanStatus s = g_tracker.start();
  g_scanning = (s == ScanStatus::kOk);
  if (!g_scanning) {
    ZW_LOGW(TAG, "scan not started (%s), retrying in %lus", scanStatusName(s),
            static_cast<unsigned long>(kScanRetryMs / 1000));
  }
}

void logStatus() {
  const TrackerStats s = g_tracker.stats();
  ZW_LOGI(TAG, "frames=%lu ibeacon=%lu rejected=%lu filtered=%lu discovered=%lu expired=%lu",
          static_cast<unsigned long>(s.framesReceived), static_cast<unsigned long>(s.beaconFrames),
          static_cast<unsigned long>(s.framesRejected), static_cast<unsigned long>(s.framesFiltered),
          static_cast<unsigned long>(s.discovered), static_cast<unsigned long>(s.expired));

  const size_t n = g_monitor.zoneStatuses(g_statuses, kMaxZones);
  for (size_t i = 0; i < n; i++) {
    const ZoneStatus& z = g_statuses[i];
    if (z.hasBeacon) {
      ZW_LOGI(TAG, "  %-12s %-7s %.2fm%s", z.name, zoneStateName(z.state), z.distanceM,
              z.enabled ? "" : " (disabled)");
    } else {
      ZW_LOGI(TAG, "  %-12s %-7s --%s", z.name, zoneStateName(z.state),
              z.enabled ? "" : " (disabled)");
    }
  }
}

} // namespace

void Zonewatch_Init(void) {
  g_indicator.begin();
  registerConfiguredZones();

  tryStartScan();
  if (!g_monitor.startMonitoring()) {
    ZW_LOGE(TAG, "zone monitoring did not start");
  }
}

void Zonewatch_Loop(void) {
  const uint32_t now = millis();

  // Retry policy lives here, the tracker only reports.
  if (!g_scanning && now - g_lastScanAttemptMs >= kScanRetryMs) {
    tryStartScan();
  }

  if (now - g_lastStatusMs >= kStatusLogMs) {
    g_lastStatusMs = now;
    logStatus();
  }
}
