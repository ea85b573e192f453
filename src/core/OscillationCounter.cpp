/* @file OscillationCounter.cpp
 * @brief 3-point trend inversion detection
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/OscillationCounter.hpp"

#include <algorithm>
#include <cmath>

using namespace spectackler::core;

void OscillationCounter::reset(double value) {
  trend_ = { value, value, value };
  peaks_.clear();
  valleys_.clear();
  seeded_ = true;
}

void OscillationCounter::observe(double value) {
  if (!seeded_) {
    reset(value);
    return;
  }

  if (std::fabs(value - trend_[2]) > threshold_)
    trend_ = { trend_[1], trend_[2], value };

  const double a = trend_[0], b = trend_[1], c = trend_[2];
  if (a < b && b > c) {
    peaks_.push_back(b);
    trend_[2] = b;
  } else if (a > b && b < c) {
    valleys_.push_back(b);
    trend_[2] = b;
  }
}

std::size_t OscillationCounter::oscillations() const {
  return std::min(peaks_.size(), valleys_.size());
}
