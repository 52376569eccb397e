#include <gtest/gtest.h>
#include "portfolio_recon/reconcile/timestamp_normalizer.hpp"

using namespace portfolio_recon;

class TimestampNormalizerTest : public ::testing::Test {
protected:
    // 2024-01-01T00:00:00Z
    static constexpr TimestampMs kNewYear2024Ms = 1704067200000LL;

    const std::vector<std::string> candidates_{"time", "ts", "created_time", "created_ts",
                                               "settled_time"};
};

TEST_F(TimestampNormalizerTest, SecondsAreScaledToMilliseconds) {
    EXPECT_EQ(TimestampNormalizer::normalize(Record(1704067200)), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, MillisecondsPassThrough) {
    EXPECT_EQ(TimestampNormalizer::normalize(Record(kNewYear2024Ms)), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, ThresholdItselfIsSeconds) {
    EXPECT_EQ(TimestampNormalizer::normalize(Record(kMillisecondThreshold)),
              kMillisecondThreshold * 1000);
    EXPECT_EQ(TimestampNormalizer::normalize(Record(kMillisecondThreshold + 1)),
              kMillisecondThreshold + 1);
}

TEST_F(TimestampNormalizerTest, RealsUseTheSameThreshold) {
    EXPECT_EQ(TimestampNormalizer::normalize(Record(1704067200.25)), kNewYear2024Ms + 250);
    EXPECT_EQ(TimestampNormalizer::normalize(Record(1704067200000.0)), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, IsoWithTrailingZ) {
    EXPECT_EQ(TimestampNormalizer::normalize(Record("2024-01-01T00:00:00Z")), kNewYear2024Ms);
    EXPECT_EQ(TimestampNormalizer::normalize(Record("2024-01-01T00:00:00.250Z")),
              kNewYear2024Ms + 250);
    EXPECT_EQ(TimestampNormalizer::normalize(Record("2024-01-01T00:00:00.123456Z")),
              kNewYear2024Ms + 123);
}

TEST_F(TimestampNormalizerTest, IsoWithNumericOffset) {
    const TimestampMs two_hours = 2 * 3600 * 1000;
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01T00:00:00+02:00"),
              kNewYear2024Ms - two_hours);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01T00:00:00-0200"),
              kNewYear2024Ms + two_hours);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01T00:00:00+00:00"), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, IsoWithoutOffsetIsUtc) {
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01T00:00:00"), kNewYear2024Ms);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01 00:00"), kNewYear2024Ms);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-01-01"), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, CivilDateArithmetic) {
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("1970-01-01T00:00:00Z"), 0);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2000-03-01T00:00:00Z"), 951868800000LL);
    EXPECT_EQ(TimestampNormalizer::parse_iso8601("2024-02-29T12:30:15Z"), 1709209815000LL);
}

TEST_F(TimestampNormalizerTest, MalformedTextIsAbsent) {
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("2024-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("2023-02-29").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("2024-01-01T24:00:00Z").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("2024-01-01T00:00:00Zjunk").has_value());
    EXPECT_FALSE(TimestampNormalizer::parse_iso8601("1704067200").has_value());
}

TEST_F(TimestampNormalizerTest, NonScalarValuesAreAbsent) {
    EXPECT_FALSE(TimestampNormalizer::normalize(Record(true)).has_value());
    EXPECT_FALSE(TimestampNormalizer::normalize(Record(nullptr)).has_value());
    EXPECT_FALSE(TimestampNormalizer::normalize(Record::array({1704067200})).has_value());
    EXPECT_FALSE(TimestampNormalizer::normalize(Record::object()).has_value());
}

TEST_F(TimestampNormalizerTest, ResolveFallsThroughMalformedCandidates) {
    Record record = {{"time", "garbage"}, {"created_time", "2024-01-01T00:00:00Z"}};

    EXPECT_EQ(TimestampNormalizer::resolve(record, candidates_), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, ResolvePrefersEarlierCandidates) {
    Record record = {{"settled_time", "2025-06-01T00:00:00Z"}, {"ts", 1704067200}};

    EXPECT_EQ(TimestampNormalizer::resolve(record, candidates_), kNewYear2024Ms);
}

TEST_F(TimestampNormalizerTest, ResolveNeverDefaults) {
    Record record = {{"time", "garbage"}, {"ts", nullptr}, {"revenue", 100}};

    EXPECT_FALSE(TimestampNormalizer::resolve(record, candidates_).has_value());
}
