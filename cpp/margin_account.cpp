#include "margin_account.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace kalman_basis {

MarginAccount::MarginAccount(double initial_cash, double leverage, double maintenance_margin_ratio)
    : cash_(initial_cash), leverage_(leverage), maintenance_margin_ratio_(maintenance_margin_ratio) {
  if (!(leverage > 0.0)) throw std::invalid_argument("leverage must be positive");
}

void MarginAccount::open(double perp_quantity, double perp_price, double future_quantity,
                         double future_price) {
  perp_ = {perp_quantity, perp_price};
  future_ = {future_quantity, future_price};
}

void MarginAccount::close() {
  perp_ = {};
  future_ = {};
}

bool MarginAccount::flat() const { return perp_.quantity == 0.0 && future_.quantity == 0.0; }

double MarginAccount::unrealized_pnl(double perp_price, double future_price) const {
  const double perp_pnl = perp_.quantity * (perp_price - perp_.entry_price);
  const double future_pnl = future_.quantity * (future_price - future_.entry_price);
  return perp_pnl + future_pnl;
}

double MarginAccount::margin_required() const {
  const double perp_margin = std::abs(perp_.quantity * perp_.entry_price) / leverage_;
  const double future_margin = std::abs(future_.quantity * future_.entry_price) / leverage_;
  return perp_margin + future_margin;
}

double MarginAccount::margin_ratio(double perp_price, double future_price) const {
  const double required = margin_required();
  if (required == 0.0) return std::numeric_limits<double>::infinity();
  return (cash_ + unrealized_pnl(perp_price, future_price)) / required;
}

bool MarginAccount::check_liquidation(double perp_price, double future_price) {
  if (margin_ratio(perp_price, future_price) < maintenance_margin_ratio_) {
    liquidated_ = true;
    return true;
  }
  return false;
}

}  // namespace kalman_basis
