/**
 * Backtest configuration and its YAML loader.
 *
 * Every key is optional; missing keys keep the defaults below.
 */

#ifndef KALMAN_BASIS_CPP_CONFIG_HPP_
#define KALMAN_BASIS_CPP_CONFIG_HPP_

#include <cstddef>
#include <optional>
#include <string>

namespace kalman_basis {

enum class EstimatorVariant {
  kContinuous,
  kWindowed,
};

constexpr double kContinuousDefaultDelta = 1e-2;
constexpr double kWindowedDefaultDelta = 1e-5;

struct EstimatorConfig {
  EstimatorVariant variant = EstimatorVariant::kContinuous;
  // Unset means the variant's default.
  std::optional<double> delta;
  double measurement_noise = 1e-3;
  std::size_t window = 500;

  double effective_delta() const;
};

struct SignalConfig {
  double z_entry = 0.8;
  double z_exit = 0.8;
  std::size_t zscore_window = 40;
  double min_hedge_ratio = 0.05;
};

struct AccountConfig {
  double initial_capital = 100000.0;
  double trade_notional = 100000.0;
  double leverage = 10.0;
  double maintenance_margin_ratio = 0.25;
};

struct DataConfig {
  std::string perp_csv = "data/processed/btc_usdt_processed.csv";
  std::string future_csv = "data/processed/btc_3m_processed.csv";
  // Empty disables writing the trade log.
  std::string trade_log_csv;
};

struct BacktestConfig {
  EstimatorConfig estimator;
  SignalConfig signal;
  AccountConfig account;
  DataConfig data;
  std::string log_level = "info";
};

/** Parse YAML text. Throws ConfigError on malformed input or invalid values. */
BacktestConfig parse_config(const std::string& yaml_text);

/** Load a YAML file. Throws ConfigError if it cannot be read or parsed. */
BacktestConfig load_config(const std::string& path);

/** Throws ConfigError when a value is out of range. */
void validate(const BacktestConfig& config);

const char* to_string(EstimatorVariant variant);

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_CONFIG_HPP_
