/**
 * pybind11 bindings: estimators, backtest and evaluator as `kalman_basis_core`.
 */

#include "backtest.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "kalman_hedge_ratio.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace py = pybind11;

namespace {

std::vector<kalman_basis::ObservationPair> to_observations(
    const std::vector<std::int64_t>& timestamps, const std::vector<double>& price_a,
    const std::vector<double>& price_b) {
  const size_t n = timestamps.size();
  if (price_a.size() != n || price_b.size() != n) {
    throw std::invalid_argument("run_backtest: timestamps, price_a, price_b must have same length");
  }
  std::vector<kalman_basis::ObservationPair> out(n);
  for (size_t i = 0; i < n; ++i) out[i] = {timestamps[i], price_a[i], price_b[i]};
  return out;
}

std::tuple<double, double> beta_of(const kalman_basis::HedgeRatioEstimator& est) {
  return {est.intercept(), est.hedge_ratio()};
}

std::vector<std::vector<double>> covariance_of(const kalman_basis::HedgeRatioEstimator& est) {
  const auto& P = est.state().covariance;
  return {{P(0, 0), P(0, 1)}, {P(1, 0), P(1, 1)}};
}

}  // namespace

PYBIND11_MODULE(kalman_basis_core, m) {
  namespace kb = kalman_basis;
  m.doc() = "Kalman spread estimators and the perp/future mean-reversion backtest.";

  py::register_exception<kb::NumericalDegeneracy>(m, "NumericalDegeneracy", PyExc_ArithmeticError);

  py::class_<kb::HedgeRatioEstimator>(m, "HedgeRatioEstimator")
      .def("update", &kb::HedgeRatioEstimator::update, py::arg("y"), py::arg("x"),
           "One step: returns (y_hat, residual).")
      .def("reset", &kb::HedgeRatioEstimator::reset)
      .def_property_readonly("beta", &beta_of)
      .def_property_readonly("P", &covariance_of)
      .def_property_readonly("hedge_ratio", &kb::HedgeRatioEstimator::hedge_ratio);

  py::class_<kb::KalmanHedgeRatio, kb::HedgeRatioEstimator>(m, "KalmanFilter")
      .def(py::init<double, double>(), py::arg("delta") = kb::kContinuousDefaultDelta,
           py::arg("R") = 1e-3);

  py::class_<kb::RollingKalmanHedgeRatio, kb::HedgeRatioEstimator>(m, "RollingKalmanFilter")
      .def(py::init<std::size_t, double, double>(), py::arg("window") = 500,
           py::arg("delta") = kb::kWindowedDefaultDelta, py::arg("R") = 1e-3)
      .def_property_readonly("spread_history", &kb::RollingKalmanHedgeRatio::residual_history);

  py::class_<kb::TradeLogEntry>(m, "TradeLogEntry")
      .def_readonly("timestamp", &kb::TradeLogEntry::timestamp)
      .def_property_readonly("position",
                             [](const kb::TradeLogEntry& e) { return kb::to_int(e.position); })
      .def_readonly("zscore", &kb::TradeLogEntry::zscore)
      .def_readonly("spread", &kb::TradeLogEntry::spread)
      .def_readonly("hedge_ratio", &kb::TradeLogEntry::hedge_ratio)
      .def_readonly("realized_pnl", &kb::TradeLogEntry::realized_pnl)
      .def_readonly("unrealized_pnl", &kb::TradeLogEntry::unrealized_pnl)
      .def_readonly("equity", &kb::TradeLogEntry::equity)
      .def_readonly("entry_signal", &kb::TradeLogEntry::entry_signal)
      .def_readonly("exit_signal", &kb::TradeLogEntry::exit_signal);

  m.def(
      "run_backtest",
      [](const std::vector<std::int64_t>& timestamps, const std::vector<double>& btc_3m,
         const std::vector<double>& btc_perp, kb::HedgeRatioEstimator& model, double z_entry,
         double z_exit, double initial_capital, double trade_notional) {
        kb::SignalConfig signal;
        signal.z_entry = z_entry;
        signal.z_exit = z_exit;
        kb::AccountConfig account;
        account.initial_capital = initial_capital;
        account.trade_notional = trade_notional;
        return kb::run_backtest(to_observations(timestamps, btc_3m, btc_perp), model, signal, account)
            .trade_log;
      },
      py::arg("timestamps"), py::arg("btc_3m"), py::arg("btc_perp"), py::arg("model"),
      py::arg("z_entry") = 0.8, py::arg("z_exit") = 0.8, py::arg("initial_capital") = 100000.0,
      py::arg("trade_notional") = 100000.0,
      "Run the spread backtest; model is updated in place. Returns the trade log.");

  m.def(
      "evaluate",
      [](const std::vector<kb::TradeLogEntry>& trade_log) { return kb::to_map(kb::evaluate(trade_log)); },
      py::arg("trade_log"), "Summary metrics as a dict.");
}
