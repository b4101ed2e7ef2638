#include "face_vision.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace presenceguard {

namespace {

// Row index of the largest face in a YuNet result, -1 if none.
int largestFaceRow(const cv::Mat &faces) {
  int best = -1;
  float best_area = 0.0f;
  for (int i = 0; i < faces.rows; i++) {
    float area = faces.at<float>(i, 2) * faces.at<float>(i, 3);
    if (area > best_area) {
      best_area = area;
      best = i;
    }
  }
  return best;
}

} // namespace

ImageQuality assessImageQuality(const cv::Mat &image, bool face_detected) {
  ImageQuality q;
  if (image.empty())
    return q;

  cv::Mat gray;
  if (image.channels() == 3)
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  else if (image.channels() == 4)
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  else
    gray = image;

  cv::Mat laplacian;
  cv::Laplacian(gray, laplacian, CV_64F);
  cv::Scalar lap_mean, lap_stddev;
  cv::meanStdDev(laplacian, lap_mean, lap_stddev);
  q.sharpness = std::min(lap_stddev[0] * lap_stddev[0] / 500.0, 1.0);

  cv::Scalar mean, stddev;
  cv::meanStdDev(gray, mean, stddev);
  q.brightness = std::max(0.0, 1.0 - std::abs(mean[0] - 128.0) / 128.0);
  q.contrast = std::min(stddev[0] / 128.0, 1.0);
  q.face = face_detected ? 1.0 : 0.0;

  q.score = 0.3 * q.sharpness + 0.2 * q.brightness + 0.2 * q.contrast +
            0.3 * q.face;
  return q;
}

std::string modelVersionFromPath(const std::string &model_path) {
  fs::path p(model_path);
  std::string filename = p.stem().string();
  const std::string prefix = "face_recognition_";
  if (filename.rfind(prefix, 0) == 0) {
    return filename.substr(prefix.length());
  }
  return filename;
}

FaceModels::FaceModels(ModelConfig config) : config_(std::move(config)) {
  detection_model_path_ = config_.models_dir + "/" + config_.detection_model;
  recognition_model_path_ =
      config_.models_dir + "/" + config_.recognition_model;
}

std::string FaceModels::modelVersion() const {
  return modelVersionFromPath(recognition_model_path_);
}

bool FaceModels::load() {
  if (loaded())
    return true;

  for (const auto &path : {detection_model_path_, recognition_model_path_}) {
    if (!fs::exists(path)) {
      Logger::log(LogLevel::ERROR, "Model file not found: " + path);
      return false;
    }
  }

  try {
    Logger::log(LogLevel::INFO, "Loading Detector: " + detection_model_path_);
    Logger::log(LogLevel::INFO,
                "Loading Recognizer: " + recognition_model_path_);
    detector_ = cv::FaceDetectorYN::create(
        detection_model_path_, "", cv::Size(320, 320),
        config_.detection_threshold, 0.3f, 5000, cv::dnn::DNN_BACKEND_OPENCV,
        cv::dnn::DNN_TARGET_CPU);
    recognizer_ = cv::FaceRecognizerSF::create(recognition_model_path_, "",
                                               cv::dnn::DNN_BACKEND_OPENCV,
                                               cv::dnn::DNN_TARGET_CPU);
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::ERROR,
                "Error loading models: " + std::string(e.what()));
    detector_.release();
    recognizer_.release();
    return false;
  }
  return true;
}

cv::Mat FaceModels::detect(const cv::Mat &frame) {
  cv::Mat faces;
  if (!detector_ || frame.empty())
    return faces;
  detector_->setInputSize(frame.size());
  detector_->detect(frame, faces);
  return faces;
}

Outcome<Embedding> SFaceExtractor::extract(const cv::Mat &image) {
  if (image.empty())
    return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                       "live image could not be decoded");
  if (!models_.load())
    return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                       "face models unavailable");
  try {
    cv::Mat faces = models_.detect(image);
    int row = largestFaceRow(faces);

    ImageQuality quality = assessImageQuality(image, row >= 0);
    if (quality.score < models_.config().min_image_quality) {
      Logger::log(LogLevel::INFO,
                  "Live image rejected, quality " +
                      std::to_string(quality.score) + " (sharpness " +
                      std::to_string(quality.sharpness) + ", brightness " +
                      std::to_string(quality.brightness) + ", contrast " +
                      std::to_string(quality.contrast) + ")");
      return Outcome<Embedding>::failure(ErrorCode::PoorImageQuality,
                                         "live image quality too low");
    }
    if (row < 0)
      return Outcome<Embedding>::failure(ErrorCode::NoFaceDetected,
                                         "no face detected in live image");

    cv::Mat aligned, feature;
    models_.recognizer()->alignCrop(image, faces.row(row), aligned);
    models_.recognizer()->feature(aligned, feature);

    cv::Mat flat = feature.reshape(1, 1);
    flat.convertTo(flat, CV_32F);
    std::vector<float> values(flat.begin<float>(), flat.end<float>());
    return Embedding::fromValues(std::move(values));
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::ERROR,
                "Embedding extraction failed: " + std::string(e.what()));
    return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                       "embedding extraction failed");
  }
}

std::optional<cv::Rect>
YuNetFaceRegionDetector::detectLargestFace(const cv::Mat &frame) {
  if (!models_.load())
    return std::nullopt;
  try {
    cv::Mat faces = models_.detect(frame);
    int row = largestFaceRow(faces);
    if (row < 0)
      return std::nullopt;
    return cv::Rect(cvRound(faces.at<float>(row, 0)),
                    cvRound(faces.at<float>(row, 1)),
                    cvRound(faces.at<float>(row, 2)),
                    cvRound(faces.at<float>(row, 3)));
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::WARN,
                "Face detection failed on frame: " + std::string(e.what()));
    return std::nullopt;
  }
}

} // namespace presenceguard
