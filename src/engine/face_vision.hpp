#pragma once

#include "capabilities.hpp"
#include "engine_config.hpp"

#include <opencv2/objdetect.hpp>
#include <string>

namespace presenceguard {

// YuNet detector + SFace recognizer, shared by the extractor and the
// liveness face-region detector.
class FaceModels {
public:
  explicit FaceModels(ModelConfig config);

  [[nodiscard]] bool load();
  bool loaded() const { return detector_ && recognizer_; }

  // Detected faces, one row per face (YuNet layout).
  cv::Mat detect(const cv::Mat &frame);
  cv::Ptr<cv::FaceRecognizerSF> recognizer() const { return recognizer_; }

  std::string modelVersion() const;
  const ModelConfig &config() const { return config_; }

private:
  ModelConfig config_;
  std::string detection_model_path_;
  std::string recognition_model_path_;
  cv::Ptr<cv::FaceDetectorYN> detector_;
  cv::Ptr<cv::FaceRecognizerSF> recognizer_;
};

// Capture quality of a live image, each component in [0, 1].
struct ImageQuality {
  double sharpness = 0.0;  // Laplacian variance / 500
  double brightness = 0.0; // distance of mean gray from 128
  double contrast = 0.0;   // gray stddev / 128
  double face = 0.0;       // 1 when a face was detected
  double score = 0.0;
};

ImageQuality assessImageQuality(const cv::Mat &image, bool face_detected);

// Model version from a recognizer filename (face_recognition_sface_2021dec
// -> sface_2021dec).
std::string modelVersionFromPath(const std::string &model_path);

class SFaceExtractor : public EmbeddingExtractor {
public:
  explicit SFaceExtractor(FaceModels &models) : models_(models) {}
  [[nodiscard]] Outcome<Embedding> extract(const cv::Mat &image) override;

private:
  FaceModels &models_;
};

class YuNetFaceRegionDetector : public FaceRegionDetector {
public:
  explicit YuNetFaceRegionDetector(FaceModels &models) : models_(models) {}
  std::optional<cv::Rect> detectLargestFace(const cv::Mat &frame) override;

private:
  FaceModels &models_;
};

} // namespace presenceguard
