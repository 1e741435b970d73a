/**
 * Rolling z-score of the spread and the tradable sample sequence built from it.
 */

#ifndef KALMAN_BASIS_CPP_ROLLING_ZSCORE_HPP_
#define KALMAN_BASIS_CPP_ROLLING_ZSCORE_HPP_

#include "types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace kalman_basis {

class RollingZScore {
 public:
  explicit RollingZScore(std::size_t window = 40);

  /**
   * Add a spread and return its z-score against the trailing window, the new
   * value included. Sample standard deviation (n - 1). Empty until the window
   * is full, and when every value in the window is identical.
   */
  std::optional<double> push(double spread);

  std::size_t window() const { return window_; }
  bool full() const { return values_.size() == window_; }
  double mean() const;
  double stddev() const;

 private:
  std::size_t window_;
  std::deque<double> values_;
};

/**
 * Pair each observation with its spread sample and keep only those whose
 * z-score is defined. `observations` and `spreads` must have equal length.
 */
std::vector<ScoredSample> score_spreads(const std::vector<ObservationPair>& observations,
                                        const std::vector<SpreadSample>& spreads,
                                        std::size_t zscore_window);

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_ROLLING_ZSCORE_HPP_
