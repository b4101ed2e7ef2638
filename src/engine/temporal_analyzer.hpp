#pragma once

#include "engine_config.hpp"
#include "errors.hpp"
#include "risk.hpp"

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace presenceguard {

using Clock = std::chrono::system_clock;

// Historical attempt as read from the ledger. A missing timestamp means
// "now"; a missing confidence is left out of confidence statistics.
struct AttemptRecord {
  std::optional<Clock::time_point> timestamp;
  std::optional<double> confidence;
  bool success = true;
};

// ISO-8601 UTC ("2024-05-01T08:30:00", optional fraction and Z/+00:00)
// or epoch seconds as a number.
std::optional<Clock::time_point> parseTimestamp(const nlohmann::json &j);
std::string formatTimestamp(Clock::time_point tp);

// HistoryParseError when a present field has the wrong shape.
[[nodiscard]] Outcome<AttemptRecord>
parseAttemptRecord(const nlohmann::json &j);

enum class PatternType {
  RapidAttempts,
  ConfidenceVariance,
  SuddenSuccessAfterFailures
};

const char *toString(PatternType type);

struct TemporalPattern {
  PatternType type = PatternType::RapidAttempts;
  RiskLevel severity = RiskLevel::Low;
  Recommendation recommendation = Recommendation::Allow;
  std::string details;
};

struct TemporalResult {
  bool evaluated = false;
  RiskLevel risk_level = RiskLevel::Low;
  std::vector<TemporalPattern> patterns;
  std::size_t total_attempts_1h = 0;
  std::size_t total_attempts_24h = 0;
  bool should_block = false;
  bool should_require_additional_verification = false;
  Recommendation recommendation = Recommendation::Allow;
};

// Post-hoc risk overlay over the recent attempt window of one identity.
class TemporalSecurityAnalyzer {
public:
  explicit TemporalSecurityAnalyzer(TemporalConfig config);

  [[nodiscard]] TemporalResult
  analyze(const std::string &identity,
          const std::vector<AttemptRecord> &recent_attempts,
          double current_confidence, Clock::time_point now = Clock::now()) const;

  std::size_t historyWindow() const { return config_.max_history; }

private:
  TemporalConfig config_;
};

} // namespace presenceguard
