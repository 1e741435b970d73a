#include "evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>

namespace kalman_basis {

Metrics evaluate(const std::vector<TradeLogEntry>& trade_log) {
  Metrics m;
  const std::size_t n = trade_log.size();
  m.number_of_trades = n;
  if (n == 0) return m;

  const TradeLogEntry& first = trade_log.front();
  // Equity before the first logged step.
  const double starting_equity = first.equity - first.realized_pnl;
  m.total_return = trade_log.back().equity - starting_equity;

  // Drawdown curve: first equity plus cumulative pnl, peak taken from the curve itself.
  double sum = 0.0;
  double peak = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const TradeLogEntry& row = trade_log[i];
    sum += row.realized_pnl + row.unrealized_pnl;
    const double curve = first.equity + sum;
    peak = i == 0 ? curve : std::max(peak, curve);
    m.max_drawdown = std::max(m.max_drawdown, peak - curve);
  }
  const double mean = sum / static_cast<double>(n);
  m.average_trade_pnl = mean;

  if (n > 1) {
    double ss = 0.0;
    for (const auto& row : trade_log) {
      const double d = row.realized_pnl + row.unrealized_pnl - mean;
      ss += d * d;
    }
    const double sd = std::sqrt(ss / static_cast<double>(n - 1));
    if (sd > 0.0) m.sharpe_ratio = mean / sd * std::sqrt(kTradingDaysPerYear);
  }
  return m;
}

std::map<std::string, double> to_map(const Metrics& metrics) {
  return {
      {"Total Return", metrics.total_return},
      {"Sharpe Ratio", metrics.sharpe_ratio},
      {"Max Drawdown", metrics.max_drawdown},
      {"Number of Trades", static_cast<double>(metrics.number_of_trades)},
      {"Average Trade PnL", metrics.average_trade_pnl},
  };
}

void print_metrics(std::ostream& os, const Metrics& metrics, const std::string& title) {
  const auto flags = os.flags();
  const auto precision = os.precision();
  os << "\n=== " << title << " ===\n" << std::fixed << std::setprecision(4);
  os << "Total Return: " << metrics.total_return << '\n';
  os << "Sharpe Ratio: " << metrics.sharpe_ratio << '\n';
  os << "Max Drawdown: " << metrics.max_drawdown << '\n';
  os << "Number of Trades: " << static_cast<double>(metrics.number_of_trades) << '\n';
  os << "Average Trade PnL: " << metrics.average_trade_pnl << '\n';
  os.flags(flags);
  os.precision(precision);
}

}  // namespace kalman_basis
