#pragma once

#include <stddef.h>
#include <stdint.h>

namespace zonewatch {

constexpr double kDefaultProcessNoise = 0.05;     // beacons are mostly stationary
constexpr double kDefaultMeasurementNoise = 3.0;  // BLE RSSI jumps a lot
constexpr size_t kDefaultMedianWindow = 3;
constexpr size_t kMaxMedianWindow = 7;
constexpr double kDefaultMaxDistanceM = 50.0;

struct FilterConfig {
  double processNoise = kDefaultProcessNoise;
  double measurementNoise = kDefaultMeasurementNoise;
  size_t medianWindow = kDefaultMedianWindow;  // 1 disables the median stage
  double maxDistanceM = kDefaultMaxDistanceM;  // raw samples beyond this are rejected
};

// Distance smoother for one beacon: outlier gate, scalar Kalman, then a
// short running median. Fixed size, no heap.
class DistanceFilter {
 public:
  explicit DistanceFilter(const FilterConfig& config = FilterConfig());

  // Feeds one raw estimate (meters) and returns the smoothed value (>= 0).
  // The first in-range sample seeds the filter.
  double update(double rawDistanceM);

  void reset();

  bool initialized() const { return initialized_; }
  double estimate() const { return estimate_; }

 private:
  double kalmanStep(double measurement);
  double medianStep(double value);

  FilterConfig config_;

  // Kalman state
  double estimate_ = 0.0;
  double errorCovariance_ = 1.0;
  bool initialized_ = false;

  // Median ring
  double window_[kMaxMedianWindow] = {0};
  size_t windowFill_ = 0;
  size_t windowIdx_ = 0;
  double lastOutput_ = 0.0;
};

}  // namespace zonewatch
