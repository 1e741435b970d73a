/**
 * Value types shared by the estimator, simulator and evaluator.
 *
 * Timestamps are milliseconds since the Unix epoch (UTC).
 * Leg "a" is the fixed-maturity future, leg "b" the perpetual.
 */

#ifndef KALMAN_BASIS_CPP_TYPES_HPP_
#define KALMAN_BASIS_CPP_TYPES_HPP_

#include <Eigen/Dense>
#include <cstdint>

namespace kalman_basis {

using Timestamp = std::int64_t;

/** [intercept, hedge_ratio] and its 2x2 covariance. */
using StateVector = Eigen::Vector2d;
using StateMatrix = Eigen::Matrix2d;

struct ObservationPair {
  Timestamp timestamp;
  double price_a;  // future
  double price_b;  // perp
};

struct SpreadSample {
  Timestamp timestamp;
  double spread;
  double hedge_ratio;
};

/** Spread sample with a defined z-score; only these reach the simulator. */
struct ScoredSample {
  ObservationPair observation;
  double spread;
  double hedge_ratio;
  double zscore;
};

enum class Position : int {
  kShort = -1,
  kFlat = 0,
  kLong = 1,
};

struct TradeLogEntry {
  Timestamp timestamp;
  Position position;
  double zscore;
  double spread;
  double hedge_ratio;
  double realized_pnl;
  double unrealized_pnl;
  double equity;
  bool entry_signal;
  bool exit_signal;
};

inline int to_int(Position p) { return static_cast<int>(p); }

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_TYPES_HPP_
