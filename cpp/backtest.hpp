/**
 * Mean-reversion backtest on the future/perp spread.
 *
 * Pipeline: estimator -> spread samples -> rolling z-score -> position
 * simulator -> trade log. Long the spread = long future, short
 * hedge_ratio-weighted perp; short the spread is the mirror image.
 */

#ifndef KALMAN_BASIS_CPP_BACKTEST_HPP_
#define KALMAN_BASIS_CPP_BACKTEST_HPP_

#include "config.hpp"
#include "kalman_hedge_ratio.hpp"
#include "margin_account.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kalman_basis {

class PositionSimulator {
 public:
  PositionSimulator(const SignalConfig& signal, const AccountConfig& account);

  /** Hedge ratio passes the floor: > 0 and |hr| >= min_hedge_ratio. */
  bool eligible(double hedge_ratio) const;

  /**
   * Evaluate one tradable sample. Returns the log entry, or nullopt when the
   * sample is ineligible; in that case nothing changes, open positions are
   * neither marked nor closed.
   */
  std::optional<TradeLogEntry> step(const ScoredSample& sample);

  Position position() const { return position_; }
  double equity() const { return equity_; }
  const MarginAccount& account() const { return account_; }
  std::size_t liquidation_breaches() const { return liquidation_breaches_; }

 private:
  void enter(Position direction, const ScoredSample& sample);

  SignalConfig signal_;
  double trade_notional_;
  double equity_;
  Position position_ = Position::kFlat;
  double entry_price_a_ = 0.0;
  double entry_price_b_ = 0.0;
  double entry_hedge_ratio_ = 1.0;
  MarginAccount account_;
  std::size_t liquidation_breaches_ = 0;
};

/** Run the estimator over every observation. Throws NumericalDegeneracy. */
std::vector<SpreadSample> estimate_spreads(const std::vector<ObservationPair>& observations,
                                           HedgeRatioEstimator& estimator,
                                           std::size_t* sign_flips = nullptr);

struct BacktestResult {
  std::vector<TradeLogEntry> trade_log;
  std::size_t observations = 0;
  std::size_t tradable_samples = 0;
  std::size_t hedge_ratio_sign_flips = 0;
  std::size_t liquidation_breaches = 0;
  double final_equity = 0.0;
};

/**
 * Full run. The estimator must be freshly constructed (or reset) by the
 * caller; it is updated in place.
 */
BacktestResult run_backtest(const std::vector<ObservationPair>& observations,
                            HedgeRatioEstimator& estimator, const SignalConfig& signal,
                            const AccountConfig& account);

/** Builds the estimator from config and runs. */
BacktestResult run_backtest(const std::vector<ObservationPair>& observations,
                            const BacktestConfig& config);

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_BACKTEST_HPP_
