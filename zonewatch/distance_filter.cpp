#include "distance_filter.h"

#include <algorithm>

namespace zonewatch {

DistanceFilter::DistanceFilter(const FilterConfig& config) : config_(config) {
  if (config_.medianWindow == 0) config_.medianWindow = 1;
  if (config_.medianWindow > kMaxMedianWindow) config_.medianWindow = kMaxMedianWindow;
  if (config_.maxDistanceM <= 0.0) config_.maxDistanceM = kDefaultMaxDistanceM;
}

void DistanceFilter::reset() {
  estimate_ = 0.0;
  errorCovariance_ = 1.0;
  initialized_ = false;
  windowFill_ = 0;
  windowIdx_ = 0;
  lastOutput_ = 0.0;
}

double DistanceFilter::update(double rawDistanceM) {
  // Outlier gate. A single multipath spike should not move the estimate.
  // NaN fails both comparisons and is treated the same way.
  const bool inRange = rawDistanceM >= 0.0 && rawDistanceM <= config_.maxDistanceM;
  if (!inRange) {
    if (initialized_) return lastOutput_;
    // Nothing to hold yet. Report the clamped value, the next good sample seeds.
    return (rawDistanceM > config_.maxDistanceM) ? config_.maxDistanceM : 0.0;
  }

  const double k = kalmanStep(rawDistanceM);
  lastOutput_ = medianStep(k);
  return lastOutput_;
}

double DistanceFilter::kalmanStep(double measurement) {
  if (!initialized_) {
    estimate_ = measurement;
    errorCovariance_ = 1.0;
    initialized_ = true;
    return estimate_;
  }

  // Predict
  const double p = errorCovariance_ + config_.processNoise;
  // Update
  const double gain = p / (p + config_.measurementNoise);
  estimate_ += gain * (measurement - estimate_);
  errorCovariance_ = (1.0 - gain) * p;

  if (estimate_ < 0.0) estimate_ = 0.0;
  return estimate_;
}

double DistanceFilter::medianStep(double value) {
  const size_t n = config_.medianWindow;
  if (n <= 1) return value;

  window_[windowIdx_] = value;
  windowIdx_ = (windowIdx_ + 1) % n;
  if (windowFill_ < n) windowFill_++;

  double sorted[kMaxMedianWindow];
  std::copy(window_, window_ + windowFill_, sorted);
  std::sort(sorted, sorted + windowFill_);
  return sorted[windowFill_ / 2];
}

}  // namespace zonewatch
