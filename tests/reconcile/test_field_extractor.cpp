#include <gtest/gtest.h>
#include "portfolio_recon/reconcile/field_extractor.hpp"

using namespace portfolio_recon;

class FieldExtractorTest : public ::testing::Test {};

TEST_F(FieldExtractorTest, FirstPresentHonorsCandidateOrder) {
    Record record = {{"size", 3}, {"count", 7}};

    auto value = FieldExtractor::first_present(record, {"count", "size"});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->get<int>(), 7);
}

TEST_F(FieldExtractorTest, NullValuesAreSkipped) {
    Record record = {{"size", nullptr}, {"count", 4}};

    auto value = FieldExtractor::first_present(record, {"size", "count"});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->get<int>(), 4);
}

TEST_F(FieldExtractorTest, AbsentEverywhereYieldsNothing) {
    Record record = {{"unrelated", 1}};

    EXPECT_FALSE(FieldExtractor::first_present(record, {"size", "count"}).has_value());
    EXPECT_FALSE(FieldExtractor::first_present(record, {}).has_value());
}

TEST_F(FieldExtractorTest, NonObjectRecordsYieldNothing) {
    EXPECT_FALSE(FieldExtractor::first_present(Record::array({1, 2}), {"size"}).has_value());
    EXPECT_FALSE(FieldExtractor::first_present(Record(), {"size"}).has_value());
    EXPECT_FALSE(FieldExtractor::extract_money(Record("text"), {{"price", 1.0}}).has_value());
}

TEST_F(FieldExtractorTest, MoneyAppliesScaleOfWinningCandidate) {
    Record cents_only = {{"balance", 4500}};
    Record both = {{"balance_dollars", "12.34"}, {"balance", 4500}};
    std::vector<MoneyField> fields = {{"balance_dollars", 1.0}, {"balance", 0.01}};

    auto from_cents = FieldExtractor::extract_money(cents_only, fields);
    ASSERT_TRUE(from_cents.has_value());
    EXPECT_DOUBLE_EQ(*from_cents, 45.0);

    auto from_dollars = FieldExtractor::extract_money(both, fields);
    ASSERT_TRUE(from_dollars.has_value());
    EXPECT_DOUBLE_EQ(*from_dollars, 12.34);
}

TEST_F(FieldExtractorTest, MalformedMoneyFallsThroughToNextCandidate) {
    Record record = {{"cash_change", "n/a"}, {"cashChange", -2.5}};

    auto amount =
        FieldExtractor::extract_money(record, {{"cash_change", 1.0}, {"cashChange", 1.0}});
    ASSERT_TRUE(amount.has_value());
    EXPECT_DOUBLE_EQ(*amount, -2.5);
}

TEST_F(FieldExtractorTest, MalformedMoneyEverywhereIsAbsent) {
    Record record = {{"cash_change", "12abc"}, {"cashChange", true}, {"other", {1, 2}}};

    EXPECT_FALSE(FieldExtractor::extract_money(
                     record, {{"cash_change", 1.0}, {"cashChange", 1.0}, {"other", 1.0}})
                     .has_value());
}

TEST_F(FieldExtractorTest, ToNumberAcceptsNumericStrings) {
    EXPECT_DOUBLE_EQ(*FieldExtractor::to_number(Record(" 0.40 ")), 0.40);
    EXPECT_DOUBLE_EQ(*FieldExtractor::to_number(Record(-3)), -3.0);
    EXPECT_FALSE(FieldExtractor::to_number(Record("")).has_value());
    EXPECT_FALSE(FieldExtractor::to_number(Record("nan")).has_value());
    EXPECT_FALSE(FieldExtractor::to_number(Record("inf")).has_value());
    EXPECT_FALSE(FieldExtractor::to_number(Record(nullptr)).has_value());
}

TEST_F(FieldExtractorTest, QuantityRejectsNegativeAndFractionalValues) {
    std::vector<std::string> fields = {"size", "count"};

    EXPECT_EQ(FieldExtractor::extract_quantity({{"size", 10}}, fields), 10);
    EXPECT_EQ(FieldExtractor::extract_quantity({{"size", "12"}}, fields), 12);
    EXPECT_EQ(FieldExtractor::extract_quantity({{"size", 5.0}}, fields), 5);
    EXPECT_EQ(FieldExtractor::extract_quantity({{"size", -1}, {"count", 2}}, fields), 2);
    EXPECT_EQ(FieldExtractor::extract_quantity({{"size", 1.5}, {"count", 3}}, fields), 3);
    EXPECT_FALSE(FieldExtractor::extract_quantity({{"size", "lots"}}, fields).has_value());
}

TEST_F(FieldExtractorTest, TextOnlyAcceptsStrings) {
    Record record = {{"ticker", 42}, {"market_ticker", "KXHIGHNY-25JAN01-B40"}};

    auto text = FieldExtractor::extract_text(record, {"ticker", "market_ticker"});
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "KXHIGHNY-25JAN01-B40");
}

TEST_F(FieldExtractorTest, ParseActionIsCaseInsensitive) {
    EXPECT_EQ(FieldExtractor::parse_action("buy"), Action::BUY);
    EXPECT_EQ(FieldExtractor::parse_action("BUY"), Action::BUY);
    EXPECT_EQ(FieldExtractor::parse_action(" Sell "), Action::SELL);
    EXPECT_EQ(FieldExtractor::parse_action("hold"), Action::UNKNOWN);
    EXPECT_EQ(FieldExtractor::parse_action(""), Action::UNKNOWN);
}
