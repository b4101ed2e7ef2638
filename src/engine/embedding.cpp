#include "embedding.hpp"

#include <cmath>
#include <regex>

namespace presenceguard {

using json = nlohmann::json;

Outcome<Embedding> Embedding::fromValues(std::vector<float> values,
                                         std::size_t expected_dim) {
  if (values.empty())
    return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                       "empty embedding");
  if (expected_dim != 0 && values.size() != expected_dim)
    return Outcome<Embedding>::failure(
        ErrorCode::MalformedInput,
        "dimension " + std::to_string(values.size()) + " != expected " +
            std::to_string(expected_dim));
  for (std::size_t i = 0; i < values.size(); i++) {
    if (!std::isfinite(values[i]))
      return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                         "non-finite value at index " +
                                             std::to_string(i));
  }
  return Outcome<Embedding>::success(Embedding(std::move(values)));
}

Outcome<Embedding> Embedding::fromJson(const json &j,
                                       std::size_t expected_dim) {
  if (j.is_string()) {
    // Some stores keep the vector as a JSON-encoded string
    json inner = json::parse(j.get<std::string>(), nullptr, false);
    if (inner.is_discarded() || !inner.is_array())
      return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                         "string embedding is not a JSON array");
    return fromJson(inner, expected_dim);
  }

  if (!j.is_array())
    return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                       std::string("embedding is a ") +
                                           j.type_name() + ", not an array");

  std::vector<float> values;
  values.reserve(j.size());
  for (const auto &v : j) {
    if (!v.is_number())
      return Outcome<Embedding>::failure(ErrorCode::MalformedInput,
                                         "non-numeric embedding value");
    values.push_back(v.get<float>());
  }
  return fromValues(std::move(values), expected_dim);
}

bool isValidIdentity(const std::string &identity) {
  if (identity.empty() || identity.length() > 64)
    return false;
  if (identity == "." || identity == "..")
    return false;
  static const std::regex re("^[a-zA-Z0-9_\\.-]+$");
  return std::regex_match(identity, re);
}

} // namespace presenceguard
