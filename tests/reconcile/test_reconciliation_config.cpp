#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include "../core/test_base.hpp"
#include "portfolio_recon/reconcile/reconciliation_config.hpp"

using namespace portfolio_recon;
using namespace portfolio_recon::testing;

class ReconciliationConfigTest : public ReconTestBase {
protected:
    void SetUp() override {
        ReconTestBase::SetUp();
        unsetenv("TOTAL_DEPOSITS");
        unsetenv("LOOKBACK_DAYS");
    }

    void TearDown() override {
        unsetenv("TOTAL_DEPOSITS");
        unsetenv("LOOKBACK_DAYS");
        ReconTestBase::TearDown();
    }
};

TEST_F(ReconciliationConfigTest, Defaults) {
    ReconciliationConfig config;

    EXPECT_DOUBLE_EQ(config.total_deposits, 40.0);
    EXPECT_EQ(config.lookback_days, 365);
    EXPECT_TRUE(config.allow_balance_fallback);
    EXPECT_FALSE(config.include_raw_records);
    ASSERT_EQ(config.schema.balance_cash_fields.size(), 1u);
    EXPECT_DOUBLE_EQ(config.schema.balance_cash_fields[0].scale, 0.01);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ReconciliationConfigTest, SaveAndLoad) {
    ReconciliationConfig config;
    config.total_deposits = 125.5;
    config.lookback_days = 30;
    config.allow_balance_fallback = false;
    config.schema.cash_change_fields = {{"revenue", 0.01}};

    auto path = std::filesystem::temp_directory_path() / "portfolio_recon_config_test.json";
    ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

    ReconciliationConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path.string()).is_ok());
    std::filesystem::remove(path);

    EXPECT_DOUBLE_EQ(loaded.total_deposits, 125.5);
    EXPECT_EQ(loaded.lookback_days, 30);
    EXPECT_FALSE(loaded.allow_balance_fallback);
    ASSERT_EQ(loaded.schema.cash_change_fields.size(), 1u);
    EXPECT_EQ(loaded.schema.cash_change_fields[0].name, "revenue");
    EXPECT_DOUBLE_EQ(loaded.schema.cash_change_fields[0].scale, 0.01);
    EXPECT_EQ(loaded.schema.timestamp_fields, config.schema.timestamp_fields);
}

TEST_F(ReconciliationConfigTest, MoneyFieldsAcceptBareNames) {
    ReconciliationConfig config;
    nlohmann::json price_fields = nlohmann::json::array({"yes_price", {{"name", "no_price"}}});
    config.from_json({{"schema", {{"price_fields", price_fields}}}});

    ASSERT_EQ(config.schema.price_fields.size(), 2u);
    EXPECT_EQ(config.schema.price_fields[0].name, "yes_price");
    EXPECT_DOUBLE_EQ(config.schema.price_fields[0].scale, 1.0);
    EXPECT_EQ(config.schema.price_fields[1].name, "no_price");
    EXPECT_DOUBLE_EQ(config.schema.price_fields[1].scale, 1.0);
    // Untouched lists keep their defaults
    EXPECT_EQ(config.schema.quantity_fields, (std::vector<std::string>{"size", "count"}));
}

TEST_F(ReconciliationConfigTest, EnvOverrides) {
    setenv("TOTAL_DEPOSITS", "250.75", 1);
    setenv("LOOKBACK_DAYS", "90", 1);

    ReconciliationConfig config;
    config.apply_env_overrides();

    EXPECT_DOUBLE_EQ(config.total_deposits, 250.75);
    EXPECT_EQ(config.lookback_days, 90);
}

TEST_F(ReconciliationConfigTest, UnparsableEnvKeepsCurrentValues) {
    setenv("TOTAL_DEPOSITS", "forty", 1);
    setenv("LOOKBACK_DAYS", "12.5", 1);

    ReconciliationConfig config;
    config.total_deposits = 10.0;
    config.apply_env_overrides();

    EXPECT_DOUBLE_EQ(config.total_deposits, 10.0);
    EXPECT_EQ(config.lookback_days, 365);
}

TEST_F(ReconciliationConfigTest, LookbackOutOfRangeIsIgnored) {
    setenv("LOOKBACK_DAYS", "0", 1);

    ReconciliationConfig config;
    config.apply_env_overrides();

    EXPECT_EQ(config.lookback_days, 365);
}

TEST_F(ReconciliationConfigTest, ValidateRejectsBadSettings) {
    ReconciliationConfig infinite_deposits;
    infinite_deposits.total_deposits = std::numeric_limits<double>::infinity();
    auto result = infinite_deposits.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);

    ReconciliationConfig no_lookback;
    no_lookback.lookback_days = 0;
    EXPECT_TRUE(no_lookback.validate().is_error());

    ReconciliationConfig no_cash_fields;
    no_cash_fields.schema.cash_change_fields.clear();
    EXPECT_TRUE(no_cash_fields.validate().is_error());
}

TEST_F(ReconciliationConfigTest, NonPositiveDepositsAreValid) {
    ReconciliationConfig config;
    config.total_deposits = 0.0;
    EXPECT_TRUE(config.validate().is_ok());

    config.total_deposits = -25.0;
    EXPECT_TRUE(config.validate().is_ok());

    config.total_deposits = std::nan("");
    EXPECT_TRUE(config.validate().is_error());
}
