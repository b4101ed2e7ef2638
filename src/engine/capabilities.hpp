#pragma once

#include "embedding.hpp"
#include "errors.hpp"
#include "temporal_analyzer.hpp"

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace presenceguard {

// Collaborators the engine consumes but does not implement itself. Concrete
// implementations are chosen at construction time.

class EmbeddingExtractor {
public:
  virtual ~EmbeddingExtractor() = default;
  // NoFaceDetected when the image holds no usable face.
  [[nodiscard]] virtual Outcome<Embedding> extract(const cv::Mat &image) = 0;
};

class FaceRegionDetector {
public:
  virtual ~FaceRegionDetector() = default;
  virtual std::optional<cv::Rect> detectLargestFace(const cv::Mat &frame) = 0;
};

// Enrolled embeddings of one identity after boundary validation.
struct EnrolledSet {
  std::vector<Embedding> embeddings;
  std::size_t excluded = 0; // corrupt entries dropped while loading
};

class EnrollmentStore {
public:
  virtual ~EnrollmentStore() = default;
  // Throws StoreError when the store itself is unreachable. An unknown
  // identity yields an empty set.
  virtual EnrolledSet getEmbeddings(const std::string &identity) = 0;
  virtual std::map<std::string, std::vector<Embedding>> getAllEmbeddings() = 0;
};

struct AttemptWindow {
  std::vector<AttemptRecord> records; // most recent first
  std::size_t skipped = 0;            // HistoryParseError records
};

class AttemptLedger {
public:
  virtual ~AttemptLedger() = default;
  // Throws StoreError when the ledger is unreachable.
  virtual AttemptWindow getRecentAttempts(const std::string &identity,
                                          std::size_t window) = 0;
  virtual void append(const std::string &identity,
                      const nlohmann::json &record) = 0;
};

} // namespace presenceguard
