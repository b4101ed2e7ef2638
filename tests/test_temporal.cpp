#include "temporal_analyzer.hpp"

#include <gtest/gtest.h>

using namespace presenceguard;
using namespace std::chrono;

namespace {

// 2024-05-01T08:30:00Z
const Clock::time_point kNow = Clock::from_time_t(1714552200);

AttemptRecord attempt(minutes ago, std::optional<double> confidence = 0.8,
                      bool success = true) {
  AttemptRecord a;
  a.timestamp = kNow - ago;
  a.confidence = confidence;
  a.success = success;
  return a;
}

bool hasPattern(const TemporalResult &r, PatternType type) {
  for (const auto &p : r.patterns) {
    if (p.type == type)
      return true;
  }
  return false;
}

} // namespace

TEST(TemporalTest, CleanHistoryIsLowRisk) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {attempt(minutes(60 * 20)),
                                        attempt(minutes(60 * 44))};

  TemporalResult r = analyzer.analyze("alice", history, 0.8, kNow);

  EXPECT_TRUE(r.evaluated);
  EXPECT_TRUE(r.patterns.empty());
  EXPECT_EQ(r.risk_level, RiskLevel::Low);
  EXPECT_EQ(r.recommendation, Recommendation::Allow);
  EXPECT_EQ(r.total_attempts_1h, 0u);
  EXPECT_EQ(r.total_attempts_24h, 1u);
}

TEST(TemporalTest, RapidAttemptsBlock) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history;
  for (int i = 0; i < 12; i++)
    history.push_back(attempt(minutes(i * 4)));

  TemporalResult r = analyzer.analyze("alice", history, 0.8, kNow);

  EXPECT_EQ(r.total_attempts_1h, 12u);
  EXPECT_TRUE(hasPattern(r, PatternType::RapidAttempts));
  EXPECT_TRUE(r.should_block);
  EXPECT_EQ(r.risk_level, RiskLevel::High);
  EXPECT_EQ(r.recommendation, Recommendation::Block);
}

TEST(TemporalTest, TenAttemptsIsStillAllowed) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history;
  for (int i = 0; i < 10; i++)
    history.push_back(attempt(minutes(i * 5)));

  TemporalResult r = analyzer.analyze("alice", history, 0.8, kNow);

  EXPECT_FALSE(r.should_block);
  EXPECT_EQ(r.total_attempts_1h, 10u);
}

TEST(TemporalTest, OnlyTheConfiguredWindowIsConsidered) {
  TemporalConfig config;
  config.max_history = 5;
  TemporalSecurityAnalyzer analyzer{config};
  std::vector<AttemptRecord> history;
  for (int i = 0; i < 15; i++)
    history.push_back(attempt(minutes(i)));

  TemporalResult r = analyzer.analyze("alice", history, 0.8, kNow);

  EXPECT_EQ(r.total_attempts_1h, 5u);
  EXPECT_FALSE(r.should_block);
}

TEST(TemporalTest, ErraticConfidenceWithMediocreCurrent) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {
      attempt(hours(2), 0.9), attempt(hours(3), 0.1), attempt(hours(4), 0.9),
      attempt(hours(5), 0.1)};

  TemporalResult r = analyzer.analyze("alice", history, 0.55, kNow);

  EXPECT_TRUE(hasPattern(r, PatternType::ConfidenceVariance));
  EXPECT_EQ(r.risk_level, RiskLevel::Medium);
  EXPECT_TRUE(r.should_require_additional_verification);
  EXPECT_FALSE(r.should_block);
  EXPECT_EQ(r.recommendation, Recommendation::AdditionalVerification);

  // A confident current attempt does not trip the check
  TemporalResult confident = analyzer.analyze("alice", history, 0.7, kNow);
  EXPECT_FALSE(hasPattern(confident, PatternType::ConfidenceVariance));
}

TEST(TemporalTest, ZeroAndMissingConfidencesAreIgnored) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {
      attempt(hours(1), 0.0), attempt(hours(2), std::nullopt),
      attempt(hours(3), 0.8), attempt(hours(4), 0.82)};

  TemporalResult r = analyzer.analyze("alice", history, 0.3, kNow);

  EXPECT_FALSE(hasPattern(r, PatternType::ConfidenceVariance));
}

TEST(TemporalTest, VarianceNeedsEnoughRecentSamples) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {attempt(hours(2), 0.95),
                                        attempt(hours(3), 0.05),
                                        attempt(hours(30), 0.95)};

  TemporalResult r = analyzer.analyze("alice", history, 0.3, kNow);

  EXPECT_EQ(r.total_attempts_24h, 2u);
  EXPECT_FALSE(hasPattern(r, PatternType::ConfidenceVariance));
}

TEST(TemporalTest, SuddenSuccessAfterFailures) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {
      attempt(minutes(5), std::nullopt, false),
      attempt(minutes(6), std::nullopt, false),
      attempt(minutes(7), std::nullopt, false)};

  TemporalResult r = analyzer.analyze("alice", history, 0.7, kNow);

  ASSERT_TRUE(hasPattern(r, PatternType::SuddenSuccessAfterFailures));
  EXPECT_EQ(r.risk_level, RiskLevel::High);
  EXPECT_FALSE(r.should_block);
  EXPECT_TRUE(r.should_require_additional_verification);
  EXPECT_EQ(r.patterns[0].details, "3 failures, then success within 5.0 minutes");
}

TEST(TemporalTest, OldFailuresDoNotTripRecovery) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history = {
      attempt(hours(2), std::nullopt, false),
      attempt(hours(3), std::nullopt, false),
      attempt(hours(4), std::nullopt, false)};

  TemporalResult r = analyzer.analyze("alice", history, 0.7, kNow);
  EXPECT_FALSE(hasPattern(r, PatternType::SuddenSuccessAfterFailures));

  // Low current confidence is not a "sudden success"
  std::vector<AttemptRecord> recent = {
      attempt(minutes(1), std::nullopt, false),
      attempt(minutes(2), std::nullopt, false),
      attempt(minutes(3), std::nullopt, false)};
  EXPECT_TRUE(analyzer.analyze("alice", recent, 0.4, kNow).patterns.empty());
}

TEST(TemporalTest, BlockSuppressesAdditionalVerification) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history;
  for (int i = 0; i < 11; i++)
    history.push_back(attempt(minutes(i + 1), std::nullopt, false));

  TemporalResult r = analyzer.analyze("alice", history, 0.7, kNow);

  EXPECT_TRUE(hasPattern(r, PatternType::RapidAttempts));
  EXPECT_TRUE(hasPattern(r, PatternType::SuddenSuccessAfterFailures));
  EXPECT_TRUE(r.should_block);
  EXPECT_FALSE(r.should_require_additional_verification);
  EXPECT_EQ(r.recommendation, Recommendation::Block);
}

TEST(TemporalTest, MissingTimestampCountsAsNow) {
  TemporalSecurityAnalyzer analyzer{TemporalConfig{}};
  std::vector<AttemptRecord> history(11, AttemptRecord{});

  TemporalResult r;
  EXPECT_NO_THROW(r = analyzer.analyze("alice", history, 0.8, kNow));
  EXPECT_EQ(r.total_attempts_1h, 11u);
  EXPECT_TRUE(r.should_block);
}

TEST(TimestampTest, ParsesLedgerFormats) {
  auto plain = parseTimestamp("2024-05-01T08:30:00");
  ASSERT_TRUE(plain);
  EXPECT_EQ(*plain, kNow);

  EXPECT_EQ(parseTimestamp("2024-05-01T08:30:00Z"), kNow);
  EXPECT_EQ(parseTimestamp("2024-05-01 08:30:00+00:00"), kNow);
  EXPECT_EQ(parseTimestamp(1714552200), kNow);

  auto fractional = parseTimestamp("2024-05-01T08:30:00.500Z");
  ASSERT_TRUE(fractional);
  EXPECT_EQ(duration_cast<milliseconds>(*fractional - kNow).count(), 500);

  EXPECT_FALSE(parseTimestamp("yesterday"));
  EXPECT_FALSE(parseTimestamp("2024-05-01T08:30:00+02:00"));
  EXPECT_FALSE(parseTimestamp(nlohmann::json::array()));
}

TEST(TimestampTest, FormatIsUtcIso) {
  EXPECT_EQ(formatTimestamp(kNow), "2024-05-01T08:30:00Z");
  EXPECT_EQ(parseTimestamp(formatTimestamp(kNow)), kNow);
}

TEST(AttemptRecordTest, ReadsLedgerFields) {
  auto r = parseAttemptRecord(
      {{"timestamp", "2024-05-01T08:30:00Z"}, {"confidence_score", 0.71},
       {"success", false}});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value().timestamp, kNow);
  EXPECT_DOUBLE_EQ(*r.value().confidence, 0.71);
  EXPECT_FALSE(r.value().success);

  auto alt = parseAttemptRecord({{"confidence", 0.5}});
  ASSERT_TRUE(alt.ok());
  EXPECT_FALSE(alt.value().timestamp);
  EXPECT_DOUBLE_EQ(*alt.value().confidence, 0.5);
  EXPECT_TRUE(alt.value().success);
}

TEST(AttemptRecordTest, RejectsWrongShapes) {
  EXPECT_EQ(parseAttemptRecord("text").error(), ErrorCode::HistoryParseError);
  EXPECT_FALSE(parseAttemptRecord({{"timestamp", "soon"}}).ok());
  EXPECT_FALSE(parseAttemptRecord({{"confidence_score", "high"}}).ok());
  EXPECT_FALSE(parseAttemptRecord({{"success", 1}}).ok());
}
