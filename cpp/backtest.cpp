/**
 * Mean-reversion backtest: spread estimation, z-score signals and the
 * Flat/Long/Short position state machine.
 */

#include "backtest.hpp"

#include "rolling_zscore.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <tuple>

namespace kalman_basis {

namespace {

int sign_of(double v) { return (v > 0.0) - (v < 0.0); }

const char* position_name(Position p) {
  switch (p) {
    case Position::kLong:
      return "long";
    case Position::kShort:
      return "short";
    case Position::kFlat:
      break;
  }
  return "flat";
}

}  // namespace

PositionSimulator::PositionSimulator(const SignalConfig& signal, const AccountConfig& account)
    : signal_(signal),
      trade_notional_(account.trade_notional),
      equity_(account.initial_capital),
      account_(account.initial_capital, account.leverage, account.maintenance_margin_ratio) {
  if (!(trade_notional_ > 0.0)) throw std::invalid_argument("trade_notional must be positive");
}

bool PositionSimulator::eligible(double hedge_ratio) const {
  return !(hedge_ratio <= 0.0 || std::abs(hedge_ratio) < signal_.min_hedge_ratio);
}

void PositionSimulator::enter(Position direction, const ScoredSample& sample) {
  position_ = direction;
  entry_price_a_ = sample.observation.price_a;
  entry_price_b_ = sample.observation.price_b;
  entry_hedge_ratio_ = sample.hedge_ratio;

  const double qty_a = trade_notional_ / entry_price_a_;
  const double qty_b = (trade_notional_ * entry_hedge_ratio_) / entry_price_b_;
  const double side = direction == Position::kLong ? 1.0 : -1.0;
  account_.open(-side * qty_b, entry_price_b_, side * qty_a, entry_price_a_);

  spdlog::debug("[Backtest] enter {} at {} | z={:.4f} future={:.2f} perp={:.2f} hr={:.5f}",
                position_name(direction), sample.observation.timestamp, sample.zscore,
                entry_price_a_, entry_price_b_, entry_hedge_ratio_);
}

std::optional<TradeLogEntry> PositionSimulator::step(const ScoredSample& sample) {
  const double hedge_ratio = sample.hedge_ratio;
  if (!eligible(hedge_ratio)) return std::nullopt;

  const double z = sample.zscore;
  const double price_a = sample.observation.price_a;
  const double price_b = sample.observation.price_b;
  bool entry_signal = false;
  bool exit_signal = false;
  double unrealized_pnl = 0.0;
  double realized_pnl = 0.0;

  if (position_ == Position::kFlat) {
    if (z < -signal_.z_entry) {
      enter(Position::kLong, sample);
      entry_signal = true;
    } else if (z > signal_.z_entry) {
      enter(Position::kShort, sample);
      entry_signal = true;
    }
  } else {
    unrealized_pnl = account_.unrealized_pnl(price_b, price_a);

    // Long exits on z < z_exit and short on z > -z_exit; both one-sided.
    const bool exiting = position_ == Position::kLong ? z < signal_.z_exit : z > -signal_.z_exit;
    if (exiting) {
      spdlog::debug("[Backtest] exit {} at {} | z={:.4f} pnl={:.2f}", position_name(position_),
                    sample.observation.timestamp, z, unrealized_pnl);
      position_ = Position::kFlat;
      realized_pnl = unrealized_pnl;
      equity_ += realized_pnl;
      unrealized_pnl = 0.0;
      exit_signal = true;
      account_.close();
      account_.set_cash(equity_);
    } else if (account_.check_liquidation(price_b, price_a)) {
      ++liquidation_breaches_;
      spdlog::warn("[Backtest] margin ratio {:.4f} below maintenance {:.4f} at {}",
                   account_.margin_ratio(price_b, price_a), account_.maintenance_margin_ratio(),
                   sample.observation.timestamp);
    }
  }

  return TradeLogEntry{sample.observation.timestamp,
                       position_,
                       z,
                       sample.spread,
                       hedge_ratio,
                       realized_pnl,
                       unrealized_pnl,
                       equity_,
                       entry_signal,
                       exit_signal};
}

std::vector<SpreadSample> estimate_spreads(const std::vector<ObservationPair>& observations,
                                           HedgeRatioEstimator& estimator,
                                           std::size_t* sign_flips) {
  std::vector<SpreadSample> spreads;
  spreads.reserve(observations.size());
  std::size_t flips = 0;
  bool have_prev = false;
  int prev_sign = 0;

  for (const auto& obs : observations) {
    const double e = std::get<1>(estimator.update(obs.price_a, obs.price_b));
    const double hedge_ratio = estimator.hedge_ratio();

    const int sign = sign_of(hedge_ratio);
    if (have_prev && sign != prev_sign) {
      ++flips;
      spdlog::warn("[Backtest] hedge ratio flipped at {}: changed sign to {:.5f}", obs.timestamp,
                   hedge_ratio);
    }
    prev_sign = sign;
    have_prev = true;

    spreads.push_back({obs.timestamp, e, hedge_ratio});
  }

  if (sign_flips != nullptr) *sign_flips = flips;
  return spreads;
}

BacktestResult run_backtest(const std::vector<ObservationPair>& observations,
                            HedgeRatioEstimator& estimator, const SignalConfig& signal,
                            const AccountConfig& account) {
  BacktestResult result;
  result.observations = observations.size();

  const auto spreads = estimate_spreads(observations, estimator, &result.hedge_ratio_sign_flips);
  const auto samples = score_spreads(observations, spreads, signal.zscore_window);
  result.tradable_samples = samples.size();
  if (samples.empty()) {
    spdlog::warn("[Backtest] {} observations, need at least {} for a z-score; nothing to trade",
                 observations.size(), signal.zscore_window);
  }

  PositionSimulator simulator(signal, account);
  result.trade_log.reserve(samples.size());
  // The first tradable sample only seeds the loop and is never evaluated.
  for (std::size_t i = 1; i < samples.size(); ++i) {
    if (auto entry = simulator.step(samples[i])) result.trade_log.push_back(*entry);
  }

  result.liquidation_breaches = simulator.liquidation_breaches();
  result.final_equity = simulator.equity();
  spdlog::info("[Backtest] {} observations, {} tradable, {} logged steps, final equity {:.2f}",
               result.observations, result.tradable_samples, result.trade_log.size(),
               result.final_equity);
  return result;
}

BacktestResult run_backtest(const std::vector<ObservationPair>& observations,
                            const BacktestConfig& config) {
  auto estimator = make_estimator(config.estimator);
  return run_backtest(observations, *estimator, config.signal, config.account);
}

}  // namespace kalman_basis
