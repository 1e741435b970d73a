/**
 * Summary metrics over a completed trade log.
 */

#ifndef KALMAN_BASIS_CPP_EVALUATOR_HPP_
#define KALMAN_BASIS_CPP_EVALUATOR_HPP_

#include "types.hpp"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace kalman_basis {

constexpr double kTradingDaysPerYear = 252.0;

struct Metrics {
  double total_return = 0.0;
  double sharpe_ratio = 0.0;
  double max_drawdown = 0.0;
  std::size_t number_of_trades = 0;
  double average_trade_pnl = 0.0;
};

/**
 * Per-step pnl = realized + unrealized. Sharpe is annualized by sqrt(252) and
 * is 0 when the pnl standard deviation is 0 or undefined. An empty log yields
 * all-zero metrics with number_of_trades == 0.
 */
Metrics evaluate(const std::vector<TradeLogEntry>& trade_log);

/** Keys: "Total Return", "Sharpe Ratio", "Max Drawdown", "Number of Trades", "Average Trade PnL". */
std::map<std::string, double> to_map(const Metrics& metrics);

void print_metrics(std::ostream& os, const Metrics& metrics,
                   const std::string& title = "Strategy Evaluation");

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_EVALUATOR_HPP_
