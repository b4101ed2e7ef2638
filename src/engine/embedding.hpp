#pragma once

#include "errors.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace presenceguard {

// Validated, immutable face embedding. Instances only come out of
// Embedding::fromValues / Embedding::fromJson, so every value is finite and
// the vector is non-empty.
class Embedding {
public:
  // expected_dim == 0 accepts any dimension.
  [[nodiscard]] static Outcome<Embedding>
  fromValues(std::vector<float> values, std::size_t expected_dim = 0);

  // Accepts a numeric array or a string holding a JSON numeric array.
  [[nodiscard]] static Outcome<Embedding>
  fromJson(const nlohmann::json &j, std::size_t expected_dim = 0);

  std::size_t dimension() const { return values_.size(); }
  const std::vector<float> &values() const { return values_; }

  // 1xD CV_32F header over the stored values. The Mat must not outlive
  // this Embedding and must not be written to.
  cv::Mat asMat() const {
    return cv::Mat(1, static_cast<int>(values_.size()), CV_32F,
                   const_cast<float *>(values_.data()));
  }

  nlohmann::json toJson() const { return values_; }

private:
  explicit Embedding(std::vector<float> values) : values_(std::move(values)) {}

  std::vector<float> values_;
};

// Identity names end up in file paths; same rule as user names elsewhere.
[[nodiscard]] bool isValidIdentity(const std::string &identity);

} // namespace presenceguard
