#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace presenceguard {

// Error taxonomy shared by every stage. Stages record these in their
// results instead of throwing past their own boundary.
enum class ErrorCode {
  None,
  MalformedInput,
  NoEnrollmentData,
  NoFaceDetected,
  PoorImageQuality,
  ComparisonFailure,
  HistoryParseError
};

inline const char *toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "NONE";
  case ErrorCode::MalformedInput:
    return "MALFORMED_INPUT";
  case ErrorCode::NoEnrollmentData:
    return "NO_ENROLLMENT_DATA";
  case ErrorCode::NoFaceDetected:
    return "NO_FACE_DETECTED";
  case ErrorCode::PoorImageQuality:
    return "POOR_IMAGE_QUALITY";
  case ErrorCode::ComparisonFailure:
    return "COMPARISON_FAILURE";
  case ErrorCode::HistoryParseError:
    return "HISTORY_PARSE_ERROR";
  }
  return "UNKNOWN";
}

// Value-or-error returned by the boundary parse/validate steps.
template <typename T> class Outcome {
public:
  static Outcome success(T value) {
    Outcome o;
    o.value_ = std::move(value);
    return o;
  }

  static Outcome failure(ErrorCode code, std::string detail) {
    Outcome o;
    o.error_ = code;
    o.detail_ = std::move(detail);
    return o;
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T &value() const { return *value_; }
  T &value() { return *value_; }
  ErrorCode error() const { return error_; }
  const std::string &detail() const { return detail_; }

private:
  Outcome() = default;

  std::optional<T> value_;
  ErrorCode error_ = ErrorCode::None;
  std::string detail_;
};

// Infrastructure failure (store or ledger unreachable). This is the only
// error class allowed to propagate out of the pipeline.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace presenceguard
