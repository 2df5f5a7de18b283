#include "nimble_radio.h"

#include <string>

#include "zw_log.h"

namespace zonewatch {

namespace {
const char* const TAG = "radio";
}  // namespace

NimbleRadio::NimbleRadio(const NimbleScanSettings& settings) : settings_(settings) {}

NimbleRadio::~NimbleRadio() {
  stopScan();
  if (taskDone_) vSemaphoreDelete(taskDone_);
}

ScanStatus NimbleRadio::startScan(AdvertisementSink* sink) {
  if (!sink) return ScanStatus::kInitFailed;
  if (running_) return ScanStatus::kOk;

  NimBLEDevice::init("");
  if (!NimBLEDevice::getInitialized()) {
    ZW_LOGE(TAG, "NimBLE init failed");
    return ScanStatus::kInitFailed;
  }

  NimBLEScan* scan = NimBLEDevice::getScan();
  if (!scan) {
    NimBLEDevice::deinit(true);
    return ScanStatus::kRadioUnavailable;
  }
  scan->setAdvertisedDeviceCallbacks(this, true /* want duplicates */);
  scan->setActiveScan(settings_.activeScan);
  scan->setInterval(settings_.interval);
  scan->setWindow(settings_.window);
  scan->setMaxResults(0);  // results go straight to onResult(), nothing is kept

  if (!taskDone_) taskDone_ = xSemaphoreCreateBinary();
  if (!taskDone_) {
    NimBLEDevice::deinit(true);
    return ScanStatus::kTaskFailed;
  }

  sink_ = sink;
  running_ = true;
  const BaseType_t ok = xTaskCreatePinnedToCore(
    scanTask,
    "zw_scan",
    settings_.taskStackBytes,
    this,
    settings_.taskPriority,
    &task_,
    settings_.taskCore
  );
  if (ok != pdPASS) {
    running_ = false;
    sink_ = nullptr;
    task_ = nullptr;
    NimBLEDevice::deinit(true);
    return ScanStatus::kTaskFailed;
  }

  ZW_LOGI(TAG, "scanning, interval=%u window=%u active=%d",
          settings_.interval, settings_.window, settings_.activeScan ? 1 : 0);
  return ScanStatus::kOk;
}

void NimbleRadio::stopScan() {
  if (!task_) return;

  running_ = false;
  NimBLEScan* scan = NimBLEDevice::getScan();
  if (scan) scan->stop();

  // Wait for the loop to leave scan->start() so no onResult() is pending.
  xSemaphoreTake(taskDone_, portMAX_DELAY);
  task_ = nullptr;
  sink_ = nullptr;

  NimBLEDevice::deinit(true);
  ZW_LOGI(TAG, "scan stopped, controller released");
}

void NimbleRadio::onResult(NimBLEAdvertisedDevice* dev) {
  if (!dev || !running_) return;
  if (!dev->haveManufacturerData()) return;

  // Keep the callback light: copy out and hand over, the tracker decodes.
  const std::string md = dev->getManufacturerData();
  AdvertisementSink* sink = sink_;
  if (sink) {
    sink->onAdvertisement(reinterpret_cast<const uint8_t*>(md.data()), md.size(),
                          dev->getRSSI(), millis());
  }
}

void NimbleRadio::scanTask(void* param) {
  NimbleRadio* self = static_cast<NimbleRadio*>(param);
  NimBLEScan* scan = NimBLEDevice::getScan();

  while (self->running_) {
    // Blocking short scan; stopScan() cuts it short.
    scan->start(self->settings_.scanDurationS, false /* is_continue */);
    scan->clearResults();
    vTaskDelay(pdMS_TO_TICKS(self->settings_.loopDelayMs));
  }

  xSemaphoreGive(self->taskDone_);
  vTaskDelete(nullptr);
}

}  // namespace zonewatch
