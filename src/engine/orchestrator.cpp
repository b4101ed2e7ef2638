#include "orchestrator.hpp"

#include "logger.hpp"

namespace presenceguard {

const char *toString(Verdict verdict) {
  switch (verdict) {
  case Verdict::Allow:
    return "ALLOW";
  case Verdict::Deny:
    return "DENY";
  case Verdict::Blocked:
    return "BLOCKED";
  }
  return "DENY";
}

const char *toString(PipelineState state) {
  switch (state) {
  case PipelineState::Start:
    return "START";
  case PipelineState::NetworkChecked:
    return "NETWORK_CHECKED";
  case PipelineState::LivenessChecked:
    return "LIVENESS_CHECKED";
  case PipelineState::FaceMatched:
    return "FACE_MATCHED";
  case PipelineState::TemporalReviewed:
    return "TEMPORAL_REVIEWED";
  case PipelineState::Decided:
    return "DECIDED";
  }
  return "UNKNOWN";
}

VerificationOrchestrator::VerificationOrchestrator(
    const EngineConfig &config, EnrollmentStore &enrollment,
    AttemptLedger &ledger, EmbeddingExtractor *extractor,
    FaceRegionDetector *face_detector)
    : network_(config.network), liveness_(config.liveness),
      matcher_(config.matcher), temporal_(config.temporal),
      enrollment_(enrollment), ledger_(ledger), extractor_(extractor),
      face_detector_(face_detector) {}

VerificationDecision
VerificationOrchestrator::deny(VerificationDecision decision,
                               const std::string &reason,
                               const std::string &message) const {
  decision.verdict = Verdict::Deny;
  decision.reason = reason;
  decision.message = message;
  decision.trail.push_back({PipelineState::Decided, "deny: " + reason});
  Logger::log(LogLevel::WARN, "Verification DENIED for " + decision.identity +
                                  " (" + reason + ")");
  return decision;
}

VerificationDecision
VerificationOrchestrator::verify(const VerificationRequest &request,
                                 Clock::time_point now) const {
  VerificationDecision d;
  d.identity = request.identity;
  d.timestamp = now;
  d.client_ip = request.client_ip;
  d.network_ssid = request.network.ssid;
  d.threshold = matcher_.config().threshold;
  d.trail.push_back({PipelineState::Start, ""});

  Logger::log(LogLevel::INFO, "Verification started for " + request.identity);

  // 1. Network gate
  d.network = network_.verify(request.network, request.client_ip);
  d.trail.push_back({PipelineState::NetworkChecked,
                     d.network.verified ? "verified" : "unverified"});
  if (!d.network.verified) {
    return deny(std::move(d), "network",
                "Network verification failed. Please ensure you are "
                "connected to the correct Wi-Fi network.");
  }

  // 2. Liveness (optional, an empty sequence counts as absent)
  if (request.liveness && !request.liveness->empty()) {
    d.liveness = liveness_.evaluate(*request.liveness);
  } else if (!request.liveness_frames.empty()) {
    if (face_detector_) {
      d.liveness = liveness_.evaluate(request.liveness_frames, *face_detector_);
    } else {
      LivenessResult unavailable;
      unavailable.frames_processed = request.liveness_frames.size();
      unavailable.reason = "face region detector unavailable";
      d.liveness = unavailable;
    }
  }

  if (d.liveness) {
    d.trail.push_back({PipelineState::LivenessChecked,
                       d.liveness->passed ? "passed" : d.liveness->reason});
    if (!d.liveness->passed) {
      return deny(std::move(d), "liveness",
                  "Liveness detection failed. Please ensure you are "
                  "physically present and follow the liveness prompts.");
    }
  } else {
    d.liveness_note = "No liveness sequence provided";
    d.trail.push_back({PipelineState::LivenessChecked, "skipped"});
  }

  // 3. Live embedding
  std::optional<Embedding> live = request.live_embedding;
  if (!live) {
    if (!extractor_ || request.live_image.empty()) {
      d.error = ErrorCode::MalformedInput;
      d.error_detail = "no live embedding or image supplied";
      d.trail.push_back({PipelineState::FaceMatched, d.error_detail});
      return deny(std::move(d), "malformed_input",
                  "No live face capture was supplied. Please try again.");
    }
    auto extracted = extractor_->extract(request.live_image);
    if (!extracted) {
      d.error = extracted.error();
      d.error_detail = extracted.detail();
      d.trail.push_back({PipelineState::FaceMatched, d.error_detail});
      if (extracted.error() == ErrorCode::NoFaceDetected) {
        return deny(std::move(d), "no_face",
                    "No face detected in the live image. Please face the "
                    "camera with good lighting and try again.");
      }
      if (extracted.error() == ErrorCode::PoorImageQuality) {
        return deny(std::move(d), "poor_image_quality",
                    "The live image quality is too low. Please retake the "
                    "photo facing the camera in good lighting.");
      }
      return deny(std::move(d), "malformed_input",
                  "The live image could not be processed. Please try again.");
    }
    live = std::move(extracted.value());
  }

  // 4. Face match against the enrolled set (StoreError propagates)
  EnrolledSet enrolled = enrollment_.getEmbeddings(request.identity);
  d.enrolled_excluded = enrolled.excluded;
  if (enrolled.embeddings.empty()) {
    d.error = ErrorCode::NoEnrollmentData;
    d.error_detail = enrolled.excluded > 0 ? "all enrolled embeddings corrupt"
                                           : "no enrolled embeddings";
    d.trail.push_back({PipelineState::FaceMatched, d.error_detail});
    return deny(std::move(d), "no_enrollment",
                enrolled.excluded > 0
                    ? "Your face data appears to be corrupted. Please "
                      "re-register your face data."
                    : "No face data found for your account. Please complete "
                      "face registration first (re-register).");
  }

  MatchResult m = matcher_.match(*live, enrolled.embeddings);
  d.match = m.match;
  d.confidence = m.confidence;
  d.raw_similarity = m.raw_similarity;
  d.consensus_score = m.consensus_score;
  d.threshold = m.threshold_used;
  d.checks = m.checks;
  d.error = m.error;
  d.error_detail = m.error_detail;
  d.face = m;
  d.trail.push_back({PipelineState::FaceMatched, m.match ? "match" : "no match"});

  switch (m.error) {
  case ErrorCode::None:
    break;
  case ErrorCode::NoEnrollmentData:
    return deny(std::move(d), "no_enrollment",
                "No usable face data found for your account. Please "
                "re-register your face data.");
  case ErrorCode::ComparisonFailure:
    d.confidence = 0.0;
    return deny(std::move(d), "comparison_failure",
                "Face verification service is temporarily unavailable. "
                "Please try again later.");
  default:
    return deny(std::move(d), "malformed_input",
                "The live face data could not be compared. Please try again.");
  }

  if (!m.match) {
    d.rejection_band = classifyRejection(m.confidence, m.raw_similarity);
    return deny(std::move(d), "face_mismatch",
                rejectionMessage(m.confidence, m.raw_similarity,
                                 m.base_threshold));
  }

  // 5. Temporal overlay, only after a successful match
  AttemptWindow history =
      ledger_.getRecentAttempts(request.identity, temporal_.historyWindow());
  d.history_skipped = history.skipped;
  TemporalResult t =
      temporal_.analyze(request.identity, history.records, m.confidence, now);
  d.risk_level = t.risk_level;
  d.recommendation = t.recommendation;
  d.temporal = t;
  d.trail.push_back({PipelineState::TemporalReviewed, toString(t.risk_level)});

  if (t.should_block) {
    d.verdict = Verdict::Blocked;
    d.reason = "temporal";
    d.message = "Authentication temporarily blocked due to suspicious "
                "activity patterns. Please contact administrator.";
    d.trail.push_back({PipelineState::Decided, "blocked"});
    Logger::log(LogLevel::ERROR,
                "Verification BLOCKED for " + request.identity +
                    " due to suspicious attempt patterns");
    return d;
  }

  d.additional_verification_recommended =
      t.should_require_additional_verification;
  if (d.additional_verification_recommended)
    Logger::log(LogLevel::WARN, "Additional verification recommended for " +
                                    request.identity);

  d.verdict = Verdict::Allow;
  d.message = "Verification successful.";
  d.trail.push_back({PipelineState::Decided, "allow"});
  Logger::log(LogLevel::INFO, "Verification ALLOWED for " + request.identity +
                                  " (confidence " +
                                  std::to_string(m.confidence) + ")");
  return d;
}

} // namespace presenceguard
