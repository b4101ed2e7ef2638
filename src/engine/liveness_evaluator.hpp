#pragma once

#include "engine_config.hpp"

#include <cstddef>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace presenceguard {

class FaceRegionDetector;

// One frame of a liveness sequence, reduced to what the evaluator needs.
struct FaceObservation {
  bool decoded = true; // false: frame could not be decoded, skipped
  bool face_present = false;
  double face_area = 0.0; // px^2, only meaningful when face_present
};

struct LivenessResult {
  bool evaluated = false; // false when the sequence was too short
  bool passed = false;
  double face_detection_rate = 0.0;
  bool movement_detected = false;
  std::size_t frames_processed = 0;
  std::size_t frames_decoded = 0;
  double face_area_variance = 0.0;
  std::string reason;
};

// Estimates whether a short frame sequence shows a live subject rather than
// a static photo, using variance of the detected face area.
class LivenessEvaluator {
public:
  explicit LivenessEvaluator(LivenessConfig config);

  [[nodiscard]] LivenessResult
  evaluate(const std::vector<FaceObservation> &sequence) const;

  // Runs the detector on every frame first. Empty Mats count as frames that
  // failed to decode.
  [[nodiscard]] LivenessResult evaluate(const std::vector<cv::Mat> &frames,
                                        FaceRegionDetector &detector) const;

  static std::vector<FaceObservation>
  observe(const std::vector<cv::Mat> &frames, FaceRegionDetector &detector);

private:
  LivenessConfig config_;
};

} // namespace presenceguard
