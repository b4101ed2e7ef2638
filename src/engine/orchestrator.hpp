#pragma once

#include "capabilities.hpp"
#include "engine_config.hpp"
#include "face_matcher.hpp"
#include "liveness_evaluator.hpp"
#include "network_verifier.hpp"
#include "temporal_analyzer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace presenceguard {

enum class Verdict { Allow, Deny, Blocked };

enum class PipelineState {
  Start,
  NetworkChecked,
  LivenessChecked,
  FaceMatched,
  TemporalReviewed,
  Decided
};

const char *toString(Verdict verdict);
const char *toString(PipelineState state);

struct VerificationRequest {
  std::string identity;
  NetworkContext network;
  std::string client_ip;

  // Either an already extracted embedding or an image for the extractor.
  std::optional<Embedding> live_embedding;
  cv::Mat live_image;

  // Liveness input: observations, or raw frames for the face detector.
  // Neither present (or an empty sequence) means liveness was not requested.
  std::optional<std::vector<FaceObservation>> liveness;
  std::vector<cv::Mat> liveness_frames;
};

struct StageRecord {
  PipelineState state = PipelineState::Start;
  std::string note;
};

// Final output of one verification call. Every stage that ran leaves its
// full result here, whichever branch ended the pipeline.
struct VerificationDecision {
  std::string identity;
  Clock::time_point timestamp;
  Verdict verdict = Verdict::Deny;
  std::string reason; // empty on Allow
  std::string message;

  bool match = false;
  double confidence = 0.0;
  double raw_similarity = 0.0;
  double consensus_score = 0.0;
  double threshold = 0.0;
  std::vector<SecurityCheck> checks;
  RiskLevel risk_level = RiskLevel::Low;
  Recommendation recommendation = Recommendation::Allow;
  bool additional_verification_recommended = false;
  std::optional<RejectionBand> rejection_band;

  ErrorCode error = ErrorCode::None;
  std::string error_detail;

  // Explainability record
  std::vector<StageRecord> trail;
  std::string client_ip;
  std::string network_ssid;
  NetworkResult network;
  std::optional<LivenessResult> liveness;
  std::string liveness_note;
  std::optional<MatchResult> face;
  std::optional<TemporalResult> temporal;
  std::size_t enrolled_excluded = 0;
  std::size_t history_skipped = 0;
};

// Runs network -> liveness -> face match -> temporal review for one
// attempt. Stateless between calls; collaborators are borrowed.
class VerificationOrchestrator {
public:
  VerificationOrchestrator(const EngineConfig &config,
                           EnrollmentStore &enrollment, AttemptLedger &ledger,
                           EmbeddingExtractor *extractor = nullptr,
                           FaceRegionDetector *face_detector = nullptr);

  // Only StoreError escapes; every engine-side failure becomes a decision.
  [[nodiscard]] VerificationDecision
  verify(const VerificationRequest &request,
         Clock::time_point now = Clock::now()) const;

  const NetworkVerifier &networkVerifier() const { return network_; }
  const FaceMatcher &faceMatcher() const { return matcher_; }

private:
  VerificationDecision deny(VerificationDecision decision,
                            const std::string &reason,
                            const std::string &message) const;

  NetworkVerifier network_;
  LivenessEvaluator liveness_;
  FaceMatcher matcher_;
  TemporalSecurityAnalyzer temporal_;

  EnrollmentStore &enrollment_;
  AttemptLedger &ledger_;
  EmbeddingExtractor *extractor_;
  FaceRegionDetector *face_detector_;
};

} // namespace presenceguard
