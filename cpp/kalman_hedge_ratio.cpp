/**
 * Kalman hedge ratio estimators (no pybind11).
 */

#include "kalman_hedge_ratio.hpp"

#include "errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace kalman_basis {

namespace {

void check_parameters(double delta, double measurement_noise) {
  if (!(delta >= 0.0 && delta < 1.0)) {
    throw std::invalid_argument("delta must be in [0, 1), got " + std::to_string(delta));
  }
  if (!(measurement_noise >= 0.0)) {
    throw std::invalid_argument("measurement_noise must be non-negative, got " +
                                std::to_string(measurement_noise));
  }
}

void check_observation(double y, double x) {
  if (!std::isfinite(y) || !std::isfinite(x)) {
    throw NumericalDegeneracy("non-finite observation (y=" + std::to_string(y) +
                              ", x=" + std::to_string(x) + ")");
  }
}

void check_innovation_variance(double s) {
  if (!std::isfinite(s) || std::abs(s) < kMinInnovationVariance) {
    throw NumericalDegeneracy("degenerate innovation variance " + std::to_string(s));
  }
}

}  // namespace

FilterState FilterState::initial(double delta, double measurement_noise) {
  FilterState s;
  s.beta = StateVector::Zero();
  s.covariance = StateMatrix::Identity();
  s.process_noise_cov = delta / (1.0 - delta) * StateMatrix::Identity();
  s.measurement_noise_var = measurement_noise;
  return s;
}

KalmanHedgeRatio::KalmanHedgeRatio(double delta, double measurement_noise)
    : HedgeRatioEstimator(FilterState::initial(0.0, 0.0)),
      delta_(delta),
      measurement_noise_(measurement_noise) {
  check_parameters(delta, measurement_noise);
  reset();
}

void KalmanHedgeRatio::reset() { state_ = FilterState::initial(delta_, measurement_noise_); }

std::tuple<double, double> KalmanHedgeRatio::update(double y, double x) {
  check_observation(y, x);
  const StateVector h(1.0, x);
  const StateMatrix& P = state_.covariance;

  const double y_hat = state_.beta.dot(h);
  const double e = y - y_hat;

  const StateVector Ph = P * h;
  const double S = h.dot(Ph) + state_.measurement_noise_var;
  check_innovation_variance(S);
  const StateVector K = Ph / S;

  StateMatrix P_new = P - K * (h.transpose() * P);
  P_new.array() += state_.measurement_noise_var;

  state_.beta = state_.beta + K * e;
  state_.covariance = P_new;
  return {y_hat, e};
}

RollingKalmanHedgeRatio::RollingKalmanHedgeRatio(std::size_t window, double delta,
                                                 double measurement_noise)
    : HedgeRatioEstimator(FilterState::initial(0.0, 0.0)),
      window_(window),
      delta_(delta),
      measurement_noise_(measurement_noise) {
  check_parameters(delta, measurement_noise);
  if (window == 0) throw std::invalid_argument("window must be positive");
  residual_history_.reserve(window + 1);
  reset();
}

void RollingKalmanHedgeRatio::reset() {
  state_ = FilterState::initial(delta_, measurement_noise_);
  residual_history_.clear();
}

std::tuple<double, double> RollingKalmanHedgeRatio::update(double y, double x) {
  check_observation(y, x);
  const StateVector h(1.0, x);

  // Predict.
  const StateMatrix P = state_.covariance + state_.process_noise_cov;
  const double y_hat = state_.beta.dot(h);
  const double e = y - y_hat;

  // Update.
  const Eigen::RowVector2d hP = h.transpose() * P;
  const double S = hP.dot(h.transpose()) + state_.measurement_noise_var;
  check_innovation_variance(S);
  const StateVector K = (P * h) / S;

  state_.beta = state_.beta + K * e;
  state_.covariance = P - K * hP;

  residual_history_.push_back(e);
  if (residual_history_.size() > window_) reset();

  return {y_hat, e};
}

std::unique_ptr<HedgeRatioEstimator> make_estimator(const EstimatorConfig& config) {
  const double delta = config.effective_delta();
  switch (config.variant) {
    case EstimatorVariant::kContinuous:
      return std::make_unique<KalmanHedgeRatio>(delta, config.measurement_noise);
    case EstimatorVariant::kWindowed:
      return std::make_unique<RollingKalmanHedgeRatio>(config.window, delta,
                                                       config.measurement_noise);
  }
  throw std::invalid_argument("unknown estimator variant");
}

}  // namespace kalman_basis
