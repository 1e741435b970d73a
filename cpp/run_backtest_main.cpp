/**
 * Command-line backtest: load the two processed price files, run the Kalman
 * spread strategy and print the summary metrics.
 *
 * Usage: kalman_basis_backtest [config.yaml]
 */

#include "backtest.hpp"
#include "config.hpp"
#include "data_loader.hpp"
#include "errors.hpp"
#include "evaluator.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>

namespace {

const char* report_title(kalman_basis::EstimatorVariant variant) {
  return variant == kalman_basis::EstimatorVariant::kWindowed ? "Rolling Kalman Filter"
                                                              : "Standard Kalman Filter";
}

int run(int argc, char** argv) {
  using namespace kalman_basis;

  if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
    std::cerr << "usage: " << argv[0] << " [config.yaml]\n";
    return 2;
  }
  const BacktestConfig config = argc == 2 ? load_config(argv[1]) : BacktestConfig{};
  spdlog::set_level(spdlog::level::from_str(config.log_level));
  spdlog::info("[Main] estimator={} delta={} R={} z_entry={} z_exit={}",
               to_string(config.estimator.variant), config.estimator.effective_delta(),
               config.estimator.measurement_noise, config.signal.z_entry, config.signal.z_exit);

  const auto observations = load_observations(config.data.perp_csv, config.data.future_csv);
  const BacktestResult result = run_backtest(observations, config);

  if (!config.data.trade_log_csv.empty()) save_trade_log_csv(config.data.trade_log_csv, result.trade_log);

  if (result.trade_log.empty()) {
    spdlog::warn("[Main] no trades were generated");
    return 0;
  }
  print_metrics(std::cout, evaluate(result.trade_log), report_title(config.estimator.variant));
  if (result.liquidation_breaches > 0) {
    spdlog::warn("[Main] maintenance margin breached on {} steps", result.liquidation_breaches);
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const kalman_basis::NumericalDegeneracy& e) {
    spdlog::critical("[Main] numerical degeneracy, run aborted: {}", e.what());
  } catch (const kalman_basis::ConfigError& e) {
    spdlog::error("[Main] {}", e.what());
  } catch (const kalman_basis::DataError& e) {
    spdlog::error("[Main] {}", e.what());
  } catch (const std::exception& e) {
    spdlog::error("[Main] {}", e.what());
  }
  return 1;
}
