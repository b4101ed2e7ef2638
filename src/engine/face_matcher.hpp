#pragma once

#include "embedding.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "risk.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace presenceguard {

// Per-call similarity statistics of one live embedding against an enrolled
// set. Built fresh for every match() call.
struct SimilarityAnalysis {
  std::vector<double> cosine_similarities;    // clamped to >= 0
  std::vector<double> euclidean_similarities; // 1 / (1 + distance)

  double cosine_mean = 0.0;
  double cosine_std = 0.0;
  double cosine_max = 0.0;
  double cosine_min = 0.0;
  double cosine_range = 0.0;
  double euclidean_mean = 0.0;

  double consensus_score = 0.0;
  double variance_penalty = 0.0;
  double range_penalty = 0.0;
  double final_confidence = 0.0;
};

struct SecurityCheck {
  std::string name;
  bool passed = false;
  bool critical = false;
  std::string detail;
};

struct MatchResult {
  bool match = false;
  double confidence = 0.0;
  double raw_similarity = 0.0;
  double consensus_score = 0.0;
  double base_threshold = 0.0;
  double threshold_used = 0.0; // effective primary threshold
  bool high_similarity_override = false;

  std::vector<SecurityCheck> checks;
  int checks_passed = 0;
  SimilarityAnalysis analysis;
  std::size_t total_embeddings_compared = 0;
  std::size_t excluded_embeddings = 0;

  ErrorCode error = ErrorCode::None;
  std::string error_detail;
};

// Guidance band for a rejected match, derived only from the numbers.
enum class RejectionBand { ImageQuality, Borderline, LowConfidence, WrongIdentity };

const char *toString(RejectionBand band);
RejectionBand classifyRejection(double confidence, double raw_similarity);
std::string rejectionMessage(double confidence, double raw_similarity,
                             double threshold);

enum class UniquenessRisk { Low, Medium, High, Critical };
const char *toString(UniquenessRisk risk);

struct UniquenessMatch {
  std::string other_identity;
  std::size_t embedding_index = 0;
  double similarity = 0.0;
  UniquenessRisk severity = UniquenessRisk::Low;
};

struct UniquenessResult {
  bool is_unique = true;
  UniquenessRisk risk_level = UniquenessRisk::Low;
  std::vector<UniquenessMatch> violations;
  std::vector<UniquenessMatch> suspicious;
  std::size_t identities_checked = 0;
  Recommendation recommendation = Recommendation::Allow;
};

class FaceMatcher {
public:
  explicit FaceMatcher(MatcherConfig config);

  // Fraud-resistant comparison of one live embedding against the enrolled
  // set of the claimed identity. Never throws; numeric failures come back
  // as ComparisonFailure with confidence 0.
  [[nodiscard]] MatchResult match(const Embedding &live,
                                  const std::vector<Embedding> &enrolled) const;

  // Throws cv::Exception on numeric errors. `enrolled` must be non-empty and
  // share the live dimension.
  SimilarityAnalysis analyze(const Embedding &live,
                             const std::vector<Embedding> &enrolled) const;

  // Checks that the live face does not match another identity's enrollment.
  [[nodiscard]] UniquenessResult checkUniqueness(
      const std::string &identity, const Embedding &live,
      const std::map<std::string, std::vector<Embedding>> &enrollments) const;

  // Raw cosine similarity; 0 for zero-norm or mismatched vectors.
  static double cosineSimilarity(const Embedding &a, const Embedding &b);

  const MatcherConfig &config() const { return config_; }

private:
  MatcherConfig config_;
};

} // namespace presenceguard
