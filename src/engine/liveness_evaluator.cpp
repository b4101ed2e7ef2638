#include "liveness_evaluator.hpp"

#include "capabilities.hpp"
#include "logger.hpp"

namespace presenceguard {

LivenessEvaluator::LivenessEvaluator(LivenessConfig config)
    : config_(std::move(config)) {}

LivenessResult
LivenessEvaluator::evaluate(const std::vector<FaceObservation> &sequence) const {
  LivenessResult result;
  result.frames_processed = sequence.size();

  if (sequence.size() < config_.min_frames) {
    result.reason = "insufficient frames";
    Logger::log(LogLevel::WARN,
                "Liveness: insufficient frames (" +
                    std::to_string(sequence.size()) + " < " +
                    std::to_string(config_.min_frames) + ")");
    return result;
  }
  result.evaluated = true;

  std::vector<double> areas;
  std::size_t with_face = 0;
  for (const auto &obs : sequence) {
    if (!obs.decoded)
      continue;
    result.frames_decoded++;
    if (obs.face_present) {
      with_face++;
      areas.push_back(obs.face_area);
    }
  }

  result.face_detection_rate =
      static_cast<double>(with_face) / static_cast<double>(sequence.size());

  if (!areas.empty()) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(cv::Mat(areas), mean, stddev);
    result.face_area_variance = stddev[0] * stddev[0];
  }
  if (areas.size() > 1)
    result.movement_detected =
        result.face_area_variance > config_.movement_variance_threshold;

  // Area variance from a handful of samples is unreliable, so short
  // sequences only need the detection rate.
  bool short_sequence = sequence.size() <= config_.short_sequence_frames;
  result.passed = result.face_detection_rate >= config_.min_detection_rate &&
                  (result.movement_detected || short_sequence);

  if (!result.passed) {
    if (result.face_detection_rate < config_.min_detection_rate)
      result.reason = "face not detected in enough frames";
    else
      result.reason = "no movement detected";
  }

  Logger::log(LogLevel::INFO,
              "Liveness: frames=" + std::to_string(sequence.size()) +
                  " rate=" + std::to_string(result.face_detection_rate) +
                  " area_var=" + std::to_string(result.face_area_variance) +
                  " movement=" + std::to_string(result.movement_detected) +
                  (result.passed ? " PASS" : " FAIL: " + result.reason));
  return result;
}

std::vector<FaceObservation>
LivenessEvaluator::observe(const std::vector<cv::Mat> &frames,
                           FaceRegionDetector &detector) {
  std::vector<FaceObservation> observations;
  observations.reserve(frames.size());
  for (const auto &frame : frames) {
    FaceObservation obs;
    if (frame.empty()) {
      obs.decoded = false;
      observations.push_back(obs);
      continue;
    }
    auto face = detector.detectLargestFace(frame);
    if (face) {
      obs.face_present = true;
      obs.face_area = static_cast<double>(face->area());
    }
    observations.push_back(obs);
  }
  return observations;
}

LivenessResult LivenessEvaluator::evaluate(const std::vector<cv::Mat> &frames,
                                           FaceRegionDetector &detector) const {
  return evaluate(observe(frames, detector));
}

} // namespace presenceguard
