/**
 * Two-leg margin account (perp and future) with a maintenance-margin
 * liquidation check.
 */

#ifndef KALMAN_BASIS_CPP_MARGIN_ACCOUNT_HPP_
#define KALMAN_BASIS_CPP_MARGIN_ACCOUNT_HPP_

namespace kalman_basis {

struct LegPosition {
  double quantity = 0.0;  // signed, negative is short
  double entry_price = 0.0;
};

class MarginAccount {
 public:
  explicit MarginAccount(double initial_cash = 100000.0, double leverage = 10.0,
                         double maintenance_margin_ratio = 0.25);

  void open(double perp_quantity, double perp_price, double future_quantity, double future_price);
  void close();
  bool flat() const;

  /** Mark-to-market PnL of both legs. Perp term first, then future. */
  double unrealized_pnl(double perp_price, double future_price) const;
  /** Initial margin on entry notional: |qty * entry| / leverage per leg. */
  double margin_required() const;
  /** (cash + unrealized) / margin_required; +inf with no open legs. */
  double margin_ratio(double perp_price, double future_price) const;
  /** Sets the liquidated flag (sticky) when the ratio falls below maintenance. */
  bool check_liquidation(double perp_price, double future_price);

  void set_cash(double cash) { cash_ = cash; }
  double cash() const { return cash_; }
  double leverage() const { return leverage_; }
  double maintenance_margin_ratio() const { return maintenance_margin_ratio_; }
  bool liquidated() const { return liquidated_; }
  const LegPosition& perp() const { return perp_; }
  const LegPosition& future() const { return future_; }

 private:
  double cash_;
  double leverage_;
  double maintenance_margin_ratio_;
  bool liquidated_ = false;
  LegPosition perp_;
  LegPosition future_;
};

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_MARGIN_ACCOUNT_HPP_
