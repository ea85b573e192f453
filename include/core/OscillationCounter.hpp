#pragma once
/** @file  OscillationCounter.hpp
 *  @brief Peak/valley counting on a 3-point trend, for control-loop gain scans.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <vector>

namespace spectackler::core {

  /**
 * @class OscillationCounter
 * @brief A reading enters the trend only if it moved more than `threshold`
 *        from the newest trend point. Peak: a < b > c, valley: a > b < c.
 *        After each turn the newest point is replaced by the turning value so
 *        the same turn is not counted twice.
 */
  class OscillationCounter {
  public:
    explicit OscillationCounter(double threshold = 0.1) : threshold_{ threshold } {}

    /// Seeds all three trend points with \p value and forgets counted turns.
    void reset(double value);

    void observe(double value);

    bool seeded() const { return seeded_; }
    const std::vector<double>& peaks() const { return peaks_; }
    const std::vector<double>& valleys() const { return valleys_; }

    /// Complete oscillations: min(peaks, valleys).
    std::size_t oscillations() const;

  private:
    double threshold_;
    bool seeded_{ false };
    std::array<double, 3> trend_{};
    std::vector<double> peaks_;
    std::vector<double> valleys_;
  };

} // namespace spectackler::core
