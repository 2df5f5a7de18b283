#pragma once

#include <Arduino.h>
#include <NimBLEDevice.h>

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#include "radio.h"

namespace zonewatch {

struct NimbleScanSettings {
  uint32_t scanDurationS = 1;     // short scans, restarted in a loop
  uint16_t interval = 16;         // 0.625 ms units
  uint16_t window = 16;           // <= interval
  bool activeScan = false;        // iBeacon data is in the advertisement itself
  uint32_t loopDelayMs = 5;
  uint32_t taskStackBytes = 4096;
  UBaseType_t taskPriority = 1;
  BaseType_t taskCore = 0;
};

// NimBLE-Arduino scanner feeding manufacturer data to an AdvertisementSink.
class NimbleRadio : public Radio, public NimBLEAdvertisedDeviceCallbacks {
 public:
  explicit NimbleRadio(const NimbleScanSettings& settings = NimbleScanSettings());
  ~NimbleRadio();

  ScanStatus startScan(AdvertisementSink* sink) override;
  void stopScan() override;

  // NimBLEAdvertisedDeviceCallbacks, runs on the NimBLE host task.
  void onResult(NimBLEAdvertisedDevice* dev) override;

 private:
  static void scanTask(void* param);

  NimbleScanSettings settings_;
  AdvertisementSink* sink_ = nullptr;
  TaskHandle_t task_ = nullptr;
  SemaphoreHandle_t taskDone_ = nullptr;
  volatile bool running_ = false;
};

}  // namespace zonewatch
