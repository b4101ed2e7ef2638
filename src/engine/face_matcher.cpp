#include "face_matcher.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <opencv2/core.hpp>

namespace presenceguard {

namespace {

constexpr double kEpsilon = 1e-8;

double clamp01(double v) { return std::min(1.0, std::max(0.0, v)); }

std::string fmt(const char *pattern, double a, double b) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), pattern, a, b);
  return buf;
}

std::string percent(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", v * 100.0);
  return buf;
}

} // namespace

const char *toString(RejectionBand band) {
  switch (band) {
  case RejectionBand::ImageQuality:
    return "IMAGE_QUALITY";
  case RejectionBand::Borderline:
    return "BORDERLINE";
  case RejectionBand::LowConfidence:
    return "LOW_CONFIDENCE";
  case RejectionBand::WrongIdentity:
    return "WRONG_IDENTITY";
  }
  return "WRONG_IDENTITY";
}

RejectionBand classifyRejection(double confidence, double raw_similarity) {
  if (raw_similarity > 0.9)
    return RejectionBand::ImageQuality;
  if (raw_similarity > 0.7)
    return RejectionBand::Borderline;
  if (confidence > 0.25 && confidence < 0.5)
    return RejectionBand::LowConfidence;
  return RejectionBand::WrongIdentity;
}

std::string rejectionMessage(double confidence, double raw_similarity,
                             double threshold) {
  switch (classifyRejection(confidence, raw_similarity)) {
  case RejectionBand::ImageQuality:
    return "Face verification failed. Your face was recognized (similarity: " +
           percent(raw_similarity) +
           ") but image quality caused low confidence (" + percent(confidence) +
           "). Please try with better lighting, clearer angle, or move closer "
           "to camera.";
  case RejectionBand::Borderline:
    return "Face verification failed. Moderate face match detected (" +
           percent(raw_similarity) + " similarity, " + percent(confidence) +
           " confidence vs " + percent(threshold) +
           " required). Please ensure good lighting and clear face "
           "visibility.";
  case RejectionBand::LowConfidence:
    return "Face verification failed. Confidence too low (" +
           percent(confidence) + " vs " + percent(threshold) +
           " required). Please ensure you are the registered user and try "
           "with better lighting.";
  case RejectionBand::WrongIdentity:
    break;
  }
  return "Face verification failed. Low face match confidence (" +
         percent(confidence) + " vs " + percent(threshold) +
         " required). Please ensure you are the registered user or contact "
         "support for face re-registration.";
}

const char *toString(UniquenessRisk risk) {
  switch (risk) {
  case UniquenessRisk::Low:
    return "LOW";
  case UniquenessRisk::Medium:
    return "MEDIUM";
  case UniquenessRisk::High:
    return "HIGH";
  case UniquenessRisk::Critical:
    return "CRITICAL";
  }
  return "LOW";
}

FaceMatcher::FaceMatcher(MatcherConfig config) : config_(std::move(config)) {}

double FaceMatcher::cosineSimilarity(const Embedding &a, const Embedding &b) {
  if (a.dimension() != b.dimension())
    return 0.0;
  cv::Mat ma = a.asMat();
  cv::Mat mb = b.asMat();
  double denom = cv::norm(ma) * cv::norm(mb);
  if (denom == 0.0)
    return 0.0;
  return ma.dot(mb) / denom;
}

SimilarityAnalysis
FaceMatcher::analyze(const Embedding &live,
                     const std::vector<Embedding> &enrolled) const {
  SimilarityAnalysis a;
  cv::Mat live_mat = live.asMat();

  for (const auto &stored : enrolled) {
    // No negative credit
    a.cosine_similarities.push_back(
        std::max(0.0, cosineSimilarity(live, stored)));
    double dist = cv::norm(live_mat, stored.asMat(), cv::NORM_L2);
    a.euclidean_similarities.push_back(1.0 / (1.0 + dist));
  }

  cv::Scalar mean, stddev;
  cv::meanStdDev(cv::Mat(a.cosine_similarities), mean, stddev);
  a.cosine_mean = mean[0];
  a.cosine_std = stddev[0];
  cv::minMaxLoc(cv::Mat(a.cosine_similarities), &a.cosine_min, &a.cosine_max);
  a.cosine_range = a.cosine_max - a.cosine_min;
  a.euclidean_mean = cv::mean(cv::Mat(a.euclidean_similarities))[0];

  // Agreement with most of the enrolled set, not just the best sample
  a.consensus_score = config_.cosine_weight * a.cosine_mean +
                      config_.euclidean_weight * a.euclidean_mean;

  a.variance_penalty = clamp01(a.cosine_std / (a.cosine_mean + kEpsilon) *
                               config_.variance_multiplier);
  a.range_penalty = clamp01(a.cosine_range * config_.range_multiplier);

  a.final_confidence =
      a.consensus_score *
      (1.0 - a.variance_penalty * config_.variance_penalty_weight) *
      (1.0 - a.range_penalty * config_.range_penalty_weight);
  return a;
}

MatchResult FaceMatcher::match(const Embedding &live,
                               const std::vector<Embedding> &enrolled) const {
  MatchResult result;
  result.base_threshold = config_.threshold;
  result.threshold_used = config_.threshold;

  if (config_.embedding_dim != 0 && live.dimension() != config_.embedding_dim) {
    result.error = ErrorCode::MalformedInput;
    result.error_detail = "live embedding has dimension " +
                          std::to_string(live.dimension()) + ", expected " +
                          std::to_string(config_.embedding_dim);
    Logger::log(LogLevel::WARN, "FaceMatcher: " + result.error_detail);
    return result;
  }

  std::vector<Embedding> usable;
  for (const auto &e : enrolled) {
    if (e.dimension() == live.dimension())
      usable.push_back(e);
    else
      result.excluded_embeddings++;
  }
  if (result.excluded_embeddings > 0)
    Logger::log(LogLevel::WARN,
                "FaceMatcher: excluded " +
                    std::to_string(result.excluded_embeddings) +
                    " enrolled embedding(s) with mismatched dimension");

  if (usable.empty()) {
    result.error = ErrorCode::NoEnrollmentData;
    result.error_detail = "no usable enrolled embeddings";
    Logger::log(LogLevel::WARN, "FaceMatcher: no usable enrolled embeddings");
    return result;
  }
  result.total_embeddings_compared = usable.size();

  SimilarityAnalysis a;
  try {
    a = analyze(live, usable);
  } catch (const cv::Exception &e) {
    result.error = ErrorCode::ComparisonFailure;
    result.error_detail = std::string("comparison failed: ") + e.what();
    Logger::log(LogLevel::ERROR, "FaceMatcher: " + result.error_detail);
    return result;
  }

  if (!std::isfinite(a.final_confidence) || !std::isfinite(a.cosine_max) ||
      !std::isfinite(a.consensus_score)) {
    // Overflowing inputs end up as inf/inf
    result.error = ErrorCode::ComparisonFailure;
    result.error_detail = "non-finite similarity";
    Logger::log(LogLevel::ERROR, "FaceMatcher: non-finite similarity");
    return result;
  }

  result.analysis = a;
  result.confidence = a.final_confidence;
  result.raw_similarity = a.cosine_max;
  result.consensus_score = a.consensus_score;

  Logger::log(LogLevel::INFO,
              "FaceMatcher: best=" + std::to_string(a.cosine_max) +
                  " confidence=" + std::to_string(a.final_confidence) +
                  " consensus=" + std::to_string(a.consensus_score) +
                  " variance_penalty=" + std::to_string(a.variance_penalty) +
                  " range_penalty=" + std::to_string(a.range_penalty) +
                  " enrolled=" + std::to_string(usable.size()));

  // Very high raw similarity: genuine user in poor conditions, relax the
  // downstream bars for this evaluation only.
  bool override_mode = a.cosine_max >= config_.high_similarity_override;
  result.high_similarity_override = override_mode;

  double threshold = override_mode
                         ? config_.threshold * config_.override_threshold_scale
                         : config_.threshold;
  double consensus_threshold =
      override_mode
          ? config_.consensus_threshold * config_.override_consensus_scale
          : config_.consensus_threshold;
  double variance_tolerance = override_mode
                                  ? config_.override_variance_tolerance
                                  : config_.variance_tolerance;
  double range_tolerance = override_mode ? config_.override_range_tolerance
                                         : config_.range_tolerance;
  result.threshold_used = threshold;

  result.checks = {
      {"Primary threshold", a.final_confidence >= threshold, true,
       fmt("%.4f >= %.4f", a.final_confidence, threshold)},
      {"Consensus threshold", a.consensus_score >= consensus_threshold, false,
       fmt("%.4f >= %.4f", a.consensus_score, consensus_threshold)},
      {"Variance check", a.variance_penalty < variance_tolerance, false,
       fmt("penalty %.4f < %.4f", a.variance_penalty, variance_tolerance)},
      {"Range consistency", a.range_penalty < range_tolerance, false,
       fmt("penalty %.4f < %.4f", a.range_penalty, range_tolerance)},
      {"Minimum baseline", a.cosine_max >= config_.min_acceptable_similarity,
       true,
       fmt("%.4f >= %.4f", a.cosine_max, config_.min_acceptable_similarity)},
  };

  bool critical_pass = true;
  for (const auto &check : result.checks) {
    if (check.passed)
      result.checks_passed++;
    else if (check.critical)
      critical_pass = false;
  }

  Logger::log(LogLevel::INFO,
              std::string("FaceMatcher: ") +
                  (override_mode ? "HIGH-SIMILARITY OVERRIDE" : "STANDARD") +
                  " validation");
  for (const auto &check : result.checks) {
    Logger::log(LogLevel::INFO, std::string("   ") +
                                    (check.passed ? "PASS " : "FAIL ") +
                                    check.name + ": " + check.detail);
  }

  if (override_mode)
    result.match = critical_pass;
  else
    result.match =
        critical_pass && result.checks_passed >= config_.required_checks;

  if (result.match) {
    Logger::log(LogLevel::INFO, "FaceMatcher: MATCH");
  } else {
    std::string failed;
    for (const auto &check : result.checks) {
      if (!check.passed)
        failed += (failed.empty() ? "" : ", ") + check.name;
    }
    Logger::log(LogLevel::WARN, "FaceMatcher: MISMATCH (" + failed + ")");
  }
  return result;
}

UniquenessResult FaceMatcher::checkUniqueness(
    const std::string &identity, const Embedding &live,
    const std::map<std::string, std::vector<Embedding>> &enrollments) const {
  UniquenessResult result;

  for (const auto &[other, embeddings] : enrollments) {
    if (other == identity)
      continue;
    result.identities_checked++;

    for (std::size_t i = 0; i < embeddings.size(); i++) {
      double sim = cosineSimilarity(live, embeddings[i]);
      if (!std::isfinite(sim))
        continue;
      if (sim > config_.uniqueness_violation) {
        UniquenessRisk severity = sim > config_.uniqueness_critical
                                      ? UniquenessRisk::Critical
                                      : UniquenessRisk::High;
        result.violations.push_back({other, i, sim, severity});
        Logger::log(LogLevel::WARN, "Uniqueness: face similarity " +
                                        std::to_string(sim) + " with " +
                                        other);
      } else if (sim > config_.uniqueness_suspicious) {
        result.suspicious.push_back({other, i, sim, UniquenessRisk::Medium});
      }
    }
  }

  result.is_unique = result.violations.empty();
  if (!result.is_unique) {
    bool critical = std::any_of(
        result.violations.begin(), result.violations.end(),
        [](const UniquenessMatch &m) {
          return m.severity == UniquenessRisk::Critical;
        });
    result.risk_level =
        critical ? UniquenessRisk::Critical : UniquenessRisk::High;
    result.recommendation = Recommendation::Block;
    Logger::log(LogLevel::ERROR, "Uniqueness: " + identity +
                                     " matches other enrolled identities");
  } else if (result.suspicious.size() >
             static_cast<std::size_t>(config_.uniqueness_suspicious_limit)) {
    result.risk_level = UniquenessRisk::Medium;
  }
  return result;
}

} // namespace presenceguard
