#include "temporal_analyzer.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace presenceguard {

using json = nlohmann::json;

std::optional<Clock::time_point> parseTimestamp(const json &j) {
  if (j.is_number()) {
    double secs = j.get<double>();
    if (!std::isfinite(secs))
      return std::nullopt;
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(secs)));
  }
  if (!j.is_string())
    return std::nullopt;

  std::string s = j.get<std::string>();
  if (s.size() > 10 && s[10] == ' ')
    s[10] = 'T';

  std::tm tm{};
  std::istringstream iss(s);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail())
    return std::nullopt;

  double fraction = 0.0;
  if (iss.peek() == '.') {
    std::string digits;
    digits += static_cast<char>(iss.get());
    while (std::isdigit(iss.peek()))
      digits += static_cast<char>(iss.get());
    fraction = std::stod("0" + digits);
  }

  // Only UTC offsets are accepted; the ledger writes UTC.
  std::string rest;
  iss >> rest;
  if (!rest.empty() && rest != "Z" && rest != "+00:00")
    return std::nullopt;

  std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1))
    return std::nullopt;
  return Clock::from_time_t(t) +
         std::chrono::duration_cast<Clock::duration>(
             std::chrono::duration<double>(fraction));
}

std::string formatTimestamp(Clock::time_point tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

Outcome<AttemptRecord> parseAttemptRecord(const json &j) {
  if (!j.is_object())
    return Outcome<AttemptRecord>::failure(ErrorCode::HistoryParseError,
                                           "attempt record is not an object");
  AttemptRecord record;

  if (j.contains("timestamp") && !j["timestamp"].is_null()) {
    record.timestamp = parseTimestamp(j["timestamp"]);
    if (!record.timestamp)
      return Outcome<AttemptRecord>::failure(ErrorCode::HistoryParseError,
                                             "unparsable timestamp");
  }

  const char *conf_key = j.contains("confidence_score") ? "confidence_score"
                                                        : "confidence";
  if (j.contains(conf_key) && !j[conf_key].is_null()) {
    if (!j[conf_key].is_number())
      return Outcome<AttemptRecord>::failure(ErrorCode::HistoryParseError,
                                             "non-numeric confidence");
    record.confidence = j[conf_key].get<double>();
  }

  if (j.contains("success") && !j["success"].is_null()) {
    if (!j["success"].is_boolean())
      return Outcome<AttemptRecord>::failure(ErrorCode::HistoryParseError,
                                             "non-boolean success flag");
    record.success = j["success"].get<bool>();
  }
  return Outcome<AttemptRecord>::success(record);
}

const char *toString(RiskLevel level) {
  switch (level) {
  case RiskLevel::Low:
    return "LOW";
  case RiskLevel::Medium:
    return "MEDIUM";
  case RiskLevel::High:
    return "HIGH";
  }
  return "LOW";
}

const char *toString(Recommendation rec) {
  switch (rec) {
  case Recommendation::Allow:
    return "ALLOW";
  case Recommendation::AdditionalVerification:
    return "ADDITIONAL_VERIFICATION";
  case Recommendation::Block:
    return "BLOCK";
  }
  return "ALLOW";
}

const char *toString(PatternType type) {
  switch (type) {
  case PatternType::RapidAttempts:
    return "RAPID_ATTEMPTS";
  case PatternType::ConfidenceVariance:
    return "CONFIDENCE_VARIANCE";
  case PatternType::SuddenSuccessAfterFailures:
    return "SUDDEN_SUCCESS_AFTER_FAILURES";
  }
  return "UNKNOWN";
}

TemporalSecurityAnalyzer::TemporalSecurityAnalyzer(TemporalConfig config)
    : config_(std::move(config)) {}

TemporalResult TemporalSecurityAnalyzer::analyze(
    const std::string &identity,
    const std::vector<AttemptRecord> &recent_attempts,
    double current_confidence, Clock::time_point now) const {
  TemporalResult result;
  result.evaluated = true;

  auto elapsed_sec = [now](const AttemptRecord &a) {
    Clock::time_point ts = a.timestamp.value_or(now);
    return std::chrono::duration<double>(now - ts).count();
  };

  std::size_t limit = std::min(recent_attempts.size(), config_.max_history);
  std::vector<const AttemptRecord *> recent_24h;
  for (std::size_t i = 0; i < limit; i++) {
    const AttemptRecord &a = recent_attempts[i];
    double age = elapsed_sec(a);
    if (age < config_.history_window_sec)
      recent_24h.push_back(&a);
    if (age < config_.rapid_window_sec)
      result.total_attempts_1h++;
  }
  result.total_attempts_24h = recent_24h.size();

  // Brute force
  if (result.total_attempts_1h >
      static_cast<std::size_t>(config_.rapid_max_attempts)) {
    result.patterns.push_back(
        {PatternType::RapidAttempts, RiskLevel::High, Recommendation::Block,
         std::to_string(result.total_attempts_1h) + " attempts in last " +
             std::to_string(config_.rapid_window_sec / 60) + " minutes"});
  }

  // Erratic confidence
  if (recent_24h.size() >= config_.min_variance_samples) {
    std::vector<double> confidences;
    for (const auto *a : recent_24h) {
      if (a->confidence && *a->confidence != 0.0)
        confidences.push_back(*a->confidence);
    }
    if (!confidences.empty()) {
      double mean = 0.0;
      for (double c : confidences)
        mean += c;
      mean /= static_cast<double>(confidences.size());
      double variance = 0.0;
      for (double c : confidences)
        variance += (c - mean) * (c - mean);
      variance /= static_cast<double>(confidences.size());

      if (variance > config_.confidence_variance_threshold &&
          current_confidence < config_.mediocre_confidence) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3)
            << "High confidence variance: " << variance
            << ", current: " << current_confidence;
        result.patterns.push_back({PatternType::ConfidenceVariance,
                                   RiskLevel::Medium,
                                   Recommendation::AdditionalVerification,
                                   oss.str()});
      }
    }
  }

  // Recovery right after a run of failures
  std::vector<const AttemptRecord *> failures;
  for (const auto *a : recent_24h) {
    if (!a->success)
      failures.push_back(a);
  }
  if (failures.size() >= static_cast<std::size_t>(config_.min_failures) &&
      current_confidence > config_.recovery_confidence) {
    double since_last_failure = elapsed_sec(*failures.front());
    for (const auto *a : failures)
      since_last_failure = std::min(since_last_failure, elapsed_sec(*a));

    if (since_last_failure < config_.recovery_window_sec) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(1) << failures.size()
          << " failures, then success within " << since_last_failure / 60.0
          << " minutes";
      result.patterns.push_back({PatternType::SuddenSuccessAfterFailures,
                                 RiskLevel::High,
                                 Recommendation::AdditionalVerification,
                                 oss.str()});
    }
  }

  bool any_additional = false;
  for (const auto &p : result.patterns) {
    result.risk_level = std::max(result.risk_level, p.severity);
    if (p.recommendation == Recommendation::Block)
      result.should_block = true;
    if (p.recommendation == Recommendation::AdditionalVerification)
      any_additional = true;
  }
  result.should_require_additional_verification =
      any_additional && !result.should_block;

  if (result.should_block)
    result.recommendation = Recommendation::Block;
  else if (result.should_require_additional_verification)
    result.recommendation = Recommendation::AdditionalVerification;

  if (result.patterns.empty()) {
    Logger::log(LogLevel::INFO,
                "Temporal: no suspicious patterns for " + identity);
  } else {
    Logger::log(LogLevel::WARN, "Temporal: " +
                                    std::to_string(result.patterns.size()) +
                                    " suspicious pattern(s) for " + identity);
    for (const auto &p : result.patterns) {
      Logger::log(LogLevel::WARN, std::string("   - ") + toString(p.type) +
                                      ": " + p.details + " (severity " +
                                      toString(p.severity) + ")");
    }
  }
  return result;
}

} // namespace presenceguard
