#include "rolling_zscore.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace kalman_basis {

RollingZScore::RollingZScore(std::size_t window) : window_(window) {
  if (window < 2) throw std::invalid_argument("zscore window must be at least 2");
}

double RollingZScore::mean() const {
  if (values_.empty()) return 0.0;
  return std::accumulate(values_.begin(), values_.end(), 0.0) / static_cast<double>(values_.size());
}

double RollingZScore::stddev() const {
  if (values_.size() < 2) return 0.0;
  const double m = mean();
  double ss = 0.0;
  for (double v : values_) ss += (v - m) * (v - m);
  return std::sqrt(ss / static_cast<double>(values_.size() - 1));
}

std::optional<double> RollingZScore::push(double spread) {
  values_.push_back(spread);
  if (values_.size() > window_) values_.pop_front();
  if (!full()) return std::nullopt;

  const double sd = stddev();
  if (sd == 0.0) return std::nullopt;
  return (spread - mean()) / sd;
}

std::vector<ScoredSample> score_spreads(const std::vector<ObservationPair>& observations,
                                        const std::vector<SpreadSample>& spreads,
                                        std::size_t zscore_window) {
  if (observations.size() != spreads.size()) {
    throw std::invalid_argument("score_spreads: observations and spreads must have same length");
  }
  RollingZScore zscore(zscore_window);
  std::vector<ScoredSample> out;
  if (spreads.size() >= zscore_window) out.reserve(spreads.size() - zscore_window + 1);
  for (std::size_t i = 0; i < spreads.size(); ++i) {
    const auto z = zscore.push(spreads[i].spread);
    if (!z) continue;
    out.push_back({observations[i], spreads[i].spread, spreads[i].hedge_ratio, *z});
  }
  return out;
}

}  // namespace kalman_basis
