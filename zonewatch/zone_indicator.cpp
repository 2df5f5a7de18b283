#include "zone_indicator.h"

namespace zonewatch {

namespace {
constexpr uint8_t kLedBrightnessPercent = 60;
}  // namespace

ZoneIndicator::ZoneIndicator(ZoneMonitor& monitor, int pin, uint16_t count, neoPixelType pixelType)
    : monitor_(monitor), rgb_(count, pin, pixelType) {}

void ZoneIndicator::begin() {
  rgb_.begin();
  rgb_.setBrightness(255);
  rgb_.clear();
  rgb_.show();
  monitor_.addListener(this);
  refresh();
}

void ZoneIndicator::onZoneEvent(const ZoneEvent& event) {
  (void)event;
  refresh();
}

void ZoneIndicator::onInsideAnyZoneChanged(bool inside) {
  (void)inside;
  refresh();
}

void ZoneIndicator::refresh() {
  static const RgbColor kOff = {0, 0, 0};
  static const RgbColor kGreen = {0, 180, 40};
  static const RgbColor kBlue = {0, 60, 255};

  bool inside = false;
  bool dwelling = false;
  const size_t n = monitor_.zoneStatuses(statuses_, kMaxZones);
  for (size_t i = 0; i < n; i++) {
    if (!statuses_[i].enabled || statuses_[i].state != ZoneState::kInside) continue;
    inside = true;
    if (statuses_[i].dwelling) dwelling = true;
  }

  if (dwelling) {
    setLedColor(kBlue, kLedBrightnessPercent);
  } else if (inside) {
    setLedColor(kGreen, kLedBrightnessPercent);
  } else {
    setLedColor(kOff, 0);
  }
}

void ZoneIndicator::setLedColor(const RgbColor& c, uint8_t brightnessPercent) {
  if (brightnessPercent > 100) brightnessPercent = 100;
  const uint32_t color = rgb_.Color(c.r * brightnessPercent / 100,
                                    c.g * brightnessPercent / 100,
                                    c.b * brightnessPercent / 100);
  rgb_.fill(color, 0, rgb_.numPixels());
  rgb_.show();
}

}  // namespace zonewatch
