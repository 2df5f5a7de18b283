#pragma once

#include <stddef.h>
#include <stdint.h>

namespace zonewatch {

enum class ScanStatus : uint8_t {
  kOk,
  kRadioUnavailable,   // controller missing or disabled
  kPermissionDenied,
  kInitFailed,         // host stack did not come up
  kTaskFailed,         // could not create a background task
};

const char* scanStatusName(ScanStatus s);

// Receives raw manufacturer data of each advertisement from the radio task.
class AdvertisementSink {
 public:
  virtual ~AdvertisementSink() {}
  virtual void onAdvertisement(const uint8_t* payload, size_t len, int rssi, uint32_t timestampMs) = 0;
};

class Radio {
 public:
  virtual ~Radio() {}

  // Starts delivering frames to sink. On failure nothing is delivered.
  virtual ScanStatus startScan(AdvertisementSink* sink) = 0;

  // Stops scanning and releases the controller. Returns once no further
  // onAdvertisement() call can happen. Safe when not started.
  virtual void stopScan() = 0;
};

}  // namespace zonewatch
