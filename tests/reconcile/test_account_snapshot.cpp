#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "portfolio_recon/reconcile/account_snapshot.hpp"

using namespace portfolio_recon;
using namespace portfolio_recon::testing;

class AccountSnapshotBuilderTest : public ReconTestBase {
protected:
    ReconciliationConfig config_;
};

TEST_F(AccountSnapshotBuilderTest, BalanceIsReadInCents) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot = builder.build({{"balance", 4500}}, {});

    EXPECT_DOUBLE_EQ(snapshot.cash_amount, 45.0);
    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.portfolio_total(), 45.0);
    EXPECT_EQ(snapshot.exposure_source, ExposureSource::NONE);
}

TEST_F(AccountSnapshotBuilderTest, ExposureIsSummedAcrossPositions) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 1000}}, {{{"event_exposure_dollars", "3.25"}},
                                            {{"event_exposure_dollars", "1.50"}}});

    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 4.75);
    EXPECT_DOUBLE_EQ(snapshot.portfolio_total(), 14.75);
    EXPECT_EQ(snapshot.exposure_source, ExposureSource::SUMMED_EXPOSURE);
}

TEST_F(AccountSnapshotBuilderTest, TotalCostIsUsedWhenExposureIsMissing) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot = builder.build(
        {{"balance", 0}},
        {{{"event_exposure_dollars", ""}, {"total_cost_dollars", "2.00"}},
         {{"total_cost_dollars", "0.50"}}});

    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 2.5);
}

TEST_F(AccountSnapshotBuilderTest, ExposureIsRoundedToWholeCents) {
    AccountSnapshotBuilder builder(config_);

    auto summed = builder.summed_exposure({{{"event_exposure_dollars", "1.004"}},
                                           {{"event_exposure_dollars", "2.006"}}});

    ASSERT_TRUE(summed.has_value());
    EXPECT_NEAR(*summed, 3.01, 1e-9);
}

TEST_F(AccountSnapshotBuilderTest, NegativeExposureIsFlooredAtZero) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 2000}}, {{{"event_exposure_dollars", "-4.00"}}});

    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.portfolio_total(), 20.0);
}

TEST_F(AccountSnapshotBuilderTest, PortfolioMinusCashFallbackWithoutPositions) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 3000}, {"portfolio_value", 4200}}, {});

    EXPECT_EQ(snapshot.exposure_source, ExposureSource::PORTFOLIO_MINUS_CASH);
    EXPECT_NEAR(snapshot.open_position_value, 12.0, 1e-9);
}

TEST_F(AccountSnapshotBuilderTest, FallbackIsFlooredAtZero) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 5000}, {"portfolio_value", 4000}}, {});

    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 0.0);
}

TEST_F(AccountSnapshotBuilderTest, FallbackCanBeDisabled) {
    config_.allow_balance_fallback = false;
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 3000}, {"portfolio_value", 4200}}, {});

    EXPECT_EQ(snapshot.exposure_source, ExposureSource::NONE);
    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 0.0);
}

TEST_F(AccountSnapshotBuilderTest, FallbackNotUsedWhenPositionsArePresent) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot = builder.build(
        {{"balance", 3000}, {"portfolio_value", 4200}}, {{{"market_ticker", "X"}}});

    EXPECT_EQ(snapshot.exposure_source, ExposureSource::NONE);
    EXPECT_DOUBLE_EQ(snapshot.open_position_value, 0.0);
}

TEST_F(AccountSnapshotBuilderTest, UpdatedTimestampIsEchoed) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot =
        builder.build({{"balance", 100}, {"updated_ts", 1704067200}}, {});

    EXPECT_EQ(snapshot.updated_ts, 1704067200000LL);
}

TEST_F(AccountSnapshotBuilderTest, MissingBalanceDegradesToZero) {
    AccountSnapshotBuilder builder(config_);

    AccountBalanceSnapshot snapshot = builder.build(Record::object(), {});

    EXPECT_DOUBLE_EQ(snapshot.cash_amount, 0.0);
    EXPECT_FALSE(snapshot.updated_ts.has_value());
}
