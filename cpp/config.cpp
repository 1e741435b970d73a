/**
 * YAML configuration loader (yaml-cpp).
 */

#include "config.hpp"

#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace kalman_basis {

namespace {

EstimatorVariant parse_variant(const std::string& name) {
  if (name == "continuous") return EstimatorVariant::kContinuous;
  if (name == "windowed" || name == "rolling") return EstimatorVariant::kWindowed;
  throw ConfigError("unknown estimator variant '" + name + "'");
}

BacktestConfig from_node(const YAML::Node& root) {
  BacktestConfig config;

  if (const auto est = root["estimator"]) {
    if (est["variant"]) config.estimator.variant = parse_variant(est["variant"].as<std::string>());
    if (est["delta"]) config.estimator.delta = est["delta"].as<double>();
    config.estimator.measurement_noise =
        est["measurement_noise"].as<double>(config.estimator.measurement_noise);
    config.estimator.window = est["window"].as<std::size_t>(config.estimator.window);
  }

  if (const auto sig = root["signal"]) {
    config.signal.z_entry = sig["z_entry"].as<double>(config.signal.z_entry);
    config.signal.z_exit = sig["z_exit"].as<double>(config.signal.z_exit);
    config.signal.zscore_window = sig["zscore_window"].as<std::size_t>(config.signal.zscore_window);
    config.signal.min_hedge_ratio = sig["min_hedge_ratio"].as<double>(config.signal.min_hedge_ratio);
  }

  if (const auto acct = root["account"]) {
    config.account.initial_capital = acct["initial_capital"].as<double>(config.account.initial_capital);
    config.account.trade_notional = acct["trade_notional"].as<double>(config.account.trade_notional);
    config.account.leverage = acct["leverage"].as<double>(config.account.leverage);
    config.account.maintenance_margin_ratio =
        acct["maintenance_margin_ratio"].as<double>(config.account.maintenance_margin_ratio);
  }

  if (const auto data = root["data"]) {
    config.data.perp_csv = data["perp_csv"].as<std::string>(config.data.perp_csv);
    config.data.future_csv = data["future_csv"].as<std::string>(config.data.future_csv);
    config.data.trade_log_csv = data["trade_log_csv"].as<std::string>(config.data.trade_log_csv);
  }

  if (const auto logging = root["logging"]) {
    config.log_level = logging["level"].as<std::string>(config.log_level);
  }

  validate(config);
  return config;
}

}  // namespace

double EstimatorConfig::effective_delta() const {
  if (delta.has_value()) return *delta;
  return variant == EstimatorVariant::kWindowed ? kWindowedDefaultDelta : kContinuousDefaultDelta;
}

void validate(const BacktestConfig& config) {
  const double delta = config.estimator.effective_delta();
  if (delta < 0.0 || delta >= 1.0) throw ConfigError("estimator.delta must be in [0, 1)");
  if (config.estimator.measurement_noise < 0.0) {
    throw ConfigError("estimator.measurement_noise must be non-negative");
  }
  if (config.estimator.window == 0) throw ConfigError("estimator.window must be positive");
  if (config.signal.zscore_window < 2) throw ConfigError("signal.zscore_window must be at least 2");
  if (config.signal.min_hedge_ratio < 0.0) throw ConfigError("signal.min_hedge_ratio must be non-negative");
  if (config.account.initial_capital <= 0.0) throw ConfigError("account.initial_capital must be positive");
  if (config.account.trade_notional <= 0.0) throw ConfigError("account.trade_notional must be positive");
  if (config.account.leverage <= 0.0) throw ConfigError("account.leverage must be positive");
}

BacktestConfig parse_config(const std::string& yaml_text) {
  try {
    return from_node(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
}

BacktestConfig load_config(const std::string& path) {
  try {
    return from_node(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw ConfigError("failed to load config '" + path + "': " + e.what());
  }
}

const char* to_string(EstimatorVariant variant) {
  switch (variant) {
    case EstimatorVariant::kContinuous:
      return "continuous";
    case EstimatorVariant::kWindowed:
      return "windowed";
  }
  return "unknown";
}

}  // namespace kalman_basis
