#pragma once

#include <Adafruit_NeoPixel.h>

#include "zone_monitor.h"

namespace zonewatch {

// WS2812 status LED:
//   off    outside every zone
//   green  inside at least one zone
//   blue   a zone we are inside has reached DWELL
class ZoneIndicator : public ZoneListener {
 public:
  ZoneIndicator(ZoneMonitor& monitor, int pin, uint16_t count = 1,
                neoPixelType pixelType = NEO_RGB + NEO_KHZ800);

  void begin();

  void onZoneEvent(const ZoneEvent& event) override;
  void onInsideAnyZoneChanged(bool inside) override;

 private:
  struct RgbColor { uint8_t r; uint8_t g; uint8_t b; };

  void refresh();
  void setLedColor(const RgbColor& c, uint8_t brightnessPercent);

  ZoneMonitor& monitor_;
  Adafruit_NeoPixel rgb_;
  ZoneStatus statuses_[kMaxZones];
};

}  // namespace zonewatch
