/**
 * Kalman hedge ratio estimators.
 * Fixed (future, perp) sequence; (y_hat, residual, hedge ratio) checked against
 * an independent double-precision implementation of the same update rules.
 */

#include "kalman_hedge_ratio.hpp"

#include "errors.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <vector>

namespace kalman_basis {
namespace {

constexpr double kTol = 1e-9;

struct Step {
  double price_a;
  double price_b;
  double ref_y_hat;
  double ref_residual;
  double ref_hedge_ratio;
};

// delta=1e-2, R=1e-3.
const std::vector<Step> kContinuousSequence = {
    {100.18, 100.0, 0.0, 100.18, 1.0016997298570414},
    {100.5805, 100.4221, 100.60280743897536, -0.022307438975360583, 1.0014797133627005},
    {100.8177, 100.6927, 100.85150257863413, -0.03380257863412339, 1.0011472587655919},
    {100.8606, 100.7316, 100.85664789639395, 0.00395210360605347, 1.0011861048161474},
    {100.7321, 100.5675, 100.6963049784026, 0.03579502159740855, 1.001538440401685},
    {100.5042, 100.3246, 100.48882284362959, 0.015377156370405487, 1.001690150902337},
    {100.316, 100.1642, 100.3435274023133, -0.027527402313296534, 1.001418114250928},
    {100.3306, 100.2088, 100.36066593711782, -0.03006593711781136, 1.001121061804146},
    {100.6181, 100.4844, 100.60651189926331, 0.011588100736688034, 1.001235267538212},
    {101.0787, 100.9084, 101.04262262849763, 0.03607737150237256, 1.0015893963475058},
};

// window=500, delta=1e-5, R=1e-3.
const std::vector<Step> kRollingSequence = {
    {100.18, 100.0, 0.0, 100.18, 1.001699729858043},
    {100.5805, 100.4221, 100.60280743907596, -0.022307439075959223, 1.0014706612268984},
    {100.8177, 100.6927, 100.85171478374379, -0.034014783743785415, 1.0011272181043822},
    {100.8606, 100.7316, 100.85697279814285, 0.0036272018571565923, 1.0011630187727076},
    {100.7321, 100.5675, 100.69627409331142, 0.03582590668858643, 1.0015101560585418},
    {100.5042, 100.3246, 100.48848582746376, 0.015714172536235083, 1.0016615399053352},
    {100.316, 100.1642, 100.3433804080443, -0.027380408044294313, 1.0013952154827974},
    {100.3306, 100.2088, 100.36092979788928, -0.03032979788928003, 1.0010942659851703},
    {100.6181, 100.4844, 100.60679771033438, 0.011302289665621856, 1.0012086480511289},
    {101.0787, 100.9084, 101.04250272028227, 0.036197279717725905, 1.0015785342986887},
};

void expect_same_state(const FilterState& a, const FilterState& b) {
  EXPECT_EQ(a.beta, b.beta);
  EXPECT_EQ(a.covariance, b.covariance);
  EXPECT_EQ(a.process_noise_cov, b.process_noise_cov);
  EXPECT_EQ(a.measurement_noise_var, b.measurement_noise_var);
}

TEST(KalmanHedgeRatioTest, FixedSequenceMatchesReference) {
  KalmanHedgeRatio kf(1e-2, 1e-3);
  for (size_t i = 0; i < kContinuousSequence.size(); ++i) {
    const auto& step = kContinuousSequence[i];
    auto [y_hat, residual] = kf.update(step.price_a, step.price_b);
    EXPECT_NEAR(y_hat, step.ref_y_hat, kTol) << "step " << i << " y_hat";
    EXPECT_NEAR(residual, step.ref_residual, kTol) << "step " << i << " residual";
    EXPECT_NEAR(kf.hedge_ratio(), step.ref_hedge_ratio, kTol) << "step " << i << " hedge ratio";
  }
}

TEST(KalmanHedgeRatioTest, FirstUpdateIsClosedFormCorrectionOfZeroPrior) {
  const double R = 1e-3;
  const double y = 101.5;
  const double x = 99.25;
  KalmanHedgeRatio kf(1e-2, R);
  auto [y_hat, residual] = kf.update(y, x);

  EXPECT_DOUBLE_EQ(y_hat, 0.0);
  EXPECT_DOUBLE_EQ(residual, y);
  const double s = 1.0 + x * x + R;
  EXPECT_NEAR(kf.intercept(), y / s, 1e-15);
  EXPECT_NEAR(kf.hedge_ratio(), y * x / s, 1e-12);
}

TEST(KalmanHedgeRatioTest, CovarianceUpdateAddsMeasurementNoiseToEveryElement) {
  const double R = 0.5;
  KalmanHedgeRatio kf(1e-2, R);
  kf.update(1.0, 1.0);
  // P = I - K h^T I + R with h = [1, 1], K = h / (2 + R).
  const double k = 1.0 / (2.0 + R);
  const auto& P = kf.state().covariance;
  EXPECT_NEAR(P(0, 0), 1.0 - k + R, 1e-15);
  EXPECT_NEAR(P(0, 1), -k + R, 1e-15);
  EXPECT_NEAR(P(1, 0), -k + R, 1e-15);
  EXPECT_NEAR(P(1, 1), 1.0 - k + R, 1e-15);
}

TEST(KalmanHedgeRatioTest, ProcessNoiseIsStoredButUnused) {
  KalmanHedgeRatio kf(0.2, 1e-3);
  EXPECT_DOUBLE_EQ(kf.state().process_noise_cov(0, 0), 0.25);
  EXPECT_DOUBLE_EQ(kf.state().process_noise_cov(0, 1), 0.0);

  KalmanHedgeRatio other(0.5, 1e-3);
  kf.update(100.0, 99.0);
  other.update(100.0, 99.0);
  EXPECT_EQ(kf.state().beta, other.state().beta);
  EXPECT_EQ(kf.state().covariance, other.state().covariance);
}

TEST(KalmanHedgeRatioTest, ResetRestoresInitialState) {
  KalmanHedgeRatio kf(1e-2, 1e-3);
  const FilterState initial = kf.state();
  kf.update(100.0, 80.0);
  kf.update(101.0, 81.0);
  kf.reset();
  expect_same_state(kf.state(), initial);
  EXPECT_TRUE(kf.state().beta.isZero());
  EXPECT_TRUE(kf.state().covariance.isIdentity());
}

TEST(KalmanHedgeRatioTest, NonFiniteObservationThrowsAndKeepsState) {
  KalmanHedgeRatio kf(1e-2, 1e-3);
  kf.update(100.0, 80.0);
  const FilterState before = kf.state();
  EXPECT_THROW(kf.update(100.0, std::numeric_limits<double>::quiet_NaN()), NumericalDegeneracy);
  EXPECT_THROW(kf.update(std::numeric_limits<double>::infinity(), 80.0), NumericalDegeneracy);
  expect_same_state(kf.state(), before);
}

TEST(KalmanHedgeRatioTest, VanishingInnovationVarianceThrows) {
  // With R = 0 the first update on h = [1, 1] leaves P singular along h.
  KalmanHedgeRatio kf(1e-2, 0.0);
  kf.update(1.0, 1.0);
  EXPECT_THROW(kf.update(1.0, 1.0), NumericalDegeneracy);
}

TEST(KalmanHedgeRatioTest, RejectsInvalidParameters) {
  EXPECT_THROW(KalmanHedgeRatio(1.0, 1e-3), std::invalid_argument);
  EXPECT_THROW(KalmanHedgeRatio(-0.1, 1e-3), std::invalid_argument);
  EXPECT_THROW(KalmanHedgeRatio(1e-2, -1.0), std::invalid_argument);
}

TEST(RollingKalmanHedgeRatioTest, FixedSequenceMatchesReference) {
  RollingKalmanHedgeRatio kf;
  for (size_t i = 0; i < kRollingSequence.size(); ++i) {
    const auto& step = kRollingSequence[i];
    auto [y_hat, residual] = kf.update(step.price_a, step.price_b);
    EXPECT_NEAR(y_hat, step.ref_y_hat, kTol) << "step " << i << " y_hat";
    EXPECT_NEAR(residual, step.ref_residual, kTol) << "step " << i << " residual";
    EXPECT_NEAR(kf.hedge_ratio(), step.ref_hedge_ratio, kTol) << "step " << i << " hedge ratio";
  }
  EXPECT_EQ(kf.residual_history().size(), kRollingSequence.size());
}

TEST(RollingKalmanHedgeRatioTest, FirstUpdateIsClosedFormCorrectionOfZeroPrior) {
  const double delta = 1e-5;
  const double R = 1e-3;
  const double y = 101.5;
  const double x = 99.25;
  RollingKalmanHedgeRatio kf(500, delta, R);
  kf.update(y, x);

  const double p0 = 1.0 + delta / (1.0 - delta);
  const double s = p0 * (1.0 + x * x) + R;
  EXPECT_NEAR(kf.intercept(), y * p0 / s, 1e-15);
  EXPECT_NEAR(kf.hedge_ratio(), y * p0 * x / s, 1e-12);
}

TEST(RollingKalmanHedgeRatioTest, ResetsAfterWindowPlusOneUpdates) {
  const size_t window = 5;
  RollingKalmanHedgeRatio kf(window, 1e-5, 1e-3);
  const FilterState fresh = kf.state();

  for (size_t i = 0; i < window; ++i) kf.update(100.0 + i, 99.0 + 0.5 * i);
  EXPECT_EQ(kf.residual_history().size(), window);
  EXPECT_FALSE(kf.state().beta.isZero());

  kf.update(106.0, 102.0);
  expect_same_state(kf.state(), fresh);
  EXPECT_TRUE(kf.residual_history().empty());

  // The next step behaves exactly like the first step of a new filter.
  RollingKalmanHedgeRatio reference(window, 1e-5, 1e-3);
  auto [y_hat, residual] = kf.update(107.0, 103.0);
  auto [ref_y_hat, ref_residual] = reference.update(107.0, 103.0);
  EXPECT_EQ(y_hat, ref_y_hat);
  EXPECT_EQ(residual, ref_residual);
  expect_same_state(kf.state(), reference.state());
}

TEST(RollingKalmanHedgeRatioTest, VanishingInnovationVarianceThrows) {
  RollingKalmanHedgeRatio kf(500, 0.0, 0.0);
  kf.update(1.0, 1.0);
  EXPECT_THROW(kf.update(1.0, 1.0), NumericalDegeneracy);
  EXPECT_EQ(kf.residual_history().size(), 1u);
}

TEST(RollingKalmanHedgeRatioTest, RejectsZeroWindow) {
  EXPECT_THROW(RollingKalmanHedgeRatio(0), std::invalid_argument);
}

TEST(MakeEstimatorTest, BuildsVariantWithItsDefaultDelta) {
  EstimatorConfig config;
  auto continuous = make_estimator(config);
  ASSERT_NE(dynamic_cast<KalmanHedgeRatio*>(continuous.get()), nullptr);
  EXPECT_DOUBLE_EQ(continuous->state().process_noise_cov(0, 0), 1e-2 / (1.0 - 1e-2));

  config.variant = EstimatorVariant::kWindowed;
  config.window = 42;
  auto windowed = make_estimator(config);
  auto* rolling = dynamic_cast<RollingKalmanHedgeRatio*>(windowed.get());
  ASSERT_NE(rolling, nullptr);
  EXPECT_EQ(rolling->window(), 42u);
  EXPECT_DOUBLE_EQ(rolling->delta(), 1e-5);

  config.delta = 1e-3;
  EXPECT_DOUBLE_EQ(dynamic_cast<RollingKalmanHedgeRatio&>(*make_estimator(config)).delta(), 1e-3);
}

}  // namespace
}  // namespace kalman_basis
