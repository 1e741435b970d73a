/**
 * Kalman hedge ratio estimators for the future/perp pair.
 *
 * State-space: beta = [intercept, hedge_ratio], observation y = future price,
 * feature h = [1, x] with x = perp price. y_hat = beta . h.
 *
 * KalmanHedgeRatio keeps adapting forever and uses a simplified covariance
 * update: P <- P - K (h^T P) + R, where R is added to every element of P and
 * there is no predict-step inflation. Process noise is stored but unused.
 *
 * RollingKalmanHedgeRatio runs the canonical predict/update cycle and throws
 * away everything it learned once more than `window` residuals have been
 * seen.
 */

#ifndef KALMAN_BASIS_CPP_KALMAN_HEDGE_RATIO_HPP_
#define KALMAN_BASIS_CPP_KALMAN_HEDGE_RATIO_HPP_

#include "config.hpp"
#include "types.hpp"

#include <cstddef>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace kalman_basis {

/** Smallest |h.P h + R| accepted before the gain is considered degenerate. */
constexpr double kMinInnovationVariance = 1e-12;

struct FilterState {
  StateVector beta;
  StateMatrix covariance;
  StateMatrix process_noise_cov;
  double measurement_noise_var;

  /** beta = 0, covariance = I, process noise = delta / (1 - delta) * I. */
  static FilterState initial(double delta, double measurement_noise);
};

class HedgeRatioEstimator {
 public:
  virtual ~HedgeRatioEstimator() = default;

  /**
   * One step on y = price_a, x = price_b. Returns (y_hat, residual) where
   * y_hat is predicted from the state before the update.
   * Throws NumericalDegeneracy; the state is left untouched in that case.
   */
  virtual std::tuple<double, double> update(double y, double x) = 0;

  virtual void reset() = 0;

  const FilterState& state() const { return state_; }
  double intercept() const { return state_.beta(0); }
  double hedge_ratio() const { return state_.beta(1); }

 protected:
  explicit HedgeRatioEstimator(FilterState state) : state_(std::move(state)) {}

  FilterState state_;
};

class KalmanHedgeRatio : public HedgeRatioEstimator {
 public:
  explicit KalmanHedgeRatio(double delta = kContinuousDefaultDelta, double measurement_noise = 1e-3);

  std::tuple<double, double> update(double y, double x) override;
  void reset() override;

  double delta() const { return delta_; }
  double measurement_noise() const { return measurement_noise_; }

 private:
  double delta_;
  double measurement_noise_;
};

class RollingKalmanHedgeRatio : public HedgeRatioEstimator {
 public:
  explicit RollingKalmanHedgeRatio(std::size_t window = 500, double delta = kWindowedDefaultDelta,
                                   double measurement_noise = 1e-3);

  std::tuple<double, double> update(double y, double x) override;
  void reset() override;

  std::size_t window() const { return window_; }
  double delta() const { return delta_; }
  double measurement_noise() const { return measurement_noise_; }
  /** Residuals since the last reset. */
  const std::vector<double>& residual_history() const { return residual_history_; }

 private:
  std::size_t window_;
  double delta_;
  double measurement_noise_;
  std::vector<double> residual_history_;
};

std::unique_ptr<HedgeRatioEstimator> make_estimator(const EstimatorConfig& config);

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_KALMAN_HEDGE_RATIO_HPP_
