#include "margin_account.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

namespace kalman_basis {
namespace {

TEST(MarginAccountTest, NoPositionsMeansInfiniteRatio) {
  MarginAccount account;
  EXPECT_TRUE(account.flat());
  EXPECT_DOUBLE_EQ(account.margin_required(), 0.0);
  EXPECT_TRUE(std::isinf(account.margin_ratio(100.0, 100.0)));
  EXPECT_FALSE(account.check_liquidation(100.0, 100.0));
}

TEST(MarginAccountTest, UnrealizedPnlAndMargin) {
  MarginAccount account(100000.0, 10.0, 0.25);
  // Short 2 perp at 100, long 1 future at 200.
  account.open(-2.0, 100.0, 1.0, 200.0);
  EXPECT_DOUBLE_EQ(account.unrealized_pnl(95.0, 210.0), 10.0 + 10.0);
  EXPECT_DOUBLE_EQ(account.margin_required(), (200.0 + 200.0) / 10.0);
  EXPECT_DOUBLE_EQ(account.margin_ratio(95.0, 210.0), 100020.0 / 40.0);
  EXPECT_EQ(account.perp().quantity, -2.0);
  EXPECT_EQ(account.future().entry_price, 200.0);
}

TEST(MarginAccountTest, LiquidationIsSticky) {
  MarginAccount account(10.0, 10.0, 0.25);
  account.open(-1.0, 100.0, 1.0, 100.0);
  // Equity 10 - 5 = 5 against 20 required: ratio 0.25 is not below maintenance.
  EXPECT_FALSE(account.check_liquidation(105.0, 100.0));
  EXPECT_TRUE(account.check_liquidation(106.0, 100.0));
  EXPECT_TRUE(account.liquidated());
  EXPECT_FALSE(account.check_liquidation(100.0, 100.0));
  EXPECT_TRUE(account.liquidated());
}

TEST(MarginAccountTest, CloseFlattensBothLegs) {
  MarginAccount account;
  account.open(1.0, 100.0, -1.0, 101.0);
  account.close();
  EXPECT_TRUE(account.flat());
  EXPECT_DOUBLE_EQ(account.unrealized_pnl(120.0, 80.0), 0.0);
}

TEST(MarginAccountTest, RejectsNonPositiveLeverage) {
  EXPECT_THROW(MarginAccount(1000.0, 0.0), std::invalid_argument);
}

}  // namespace
}  // namespace kalman_basis
