#pragma once

#include "constants.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace presenceguard {

// Flat "Section.key" -> value map. Lines starting with ';' or '#' are
// comments. A missing file yields an empty map.
std::unordered_map<std::string, std::string>
parse_ini(const std::string &path);

// Splits a comma separated list, trimming blanks and dropping empty items.
std::vector<std::string> split_list(const std::string &value);

struct NetworkConfig {
  std::vector<std::string> allowed_ssids;
  std::vector<std::string> allowed_ip_ranges;
  std::vector<std::string> hotspot_patterns = {
      "hotspot", "iphone", "android", "mobile", "phone", "demo", "test"};
  std::vector<std::string> hotspot_subnets = {
      "192.168.43.0/24",  // Android default
      "192.168.137.0/24", // Windows default
      "172.20.10.0/24",   // iOS default
      "10.0.0.0/24"};
  double ssid_weight = 0.4;
  double ip_weight = 0.4;
  double hotspot_weight = 0.2;
};

struct MatcherConfig {
  std::size_t embedding_dim = 0; // 0 = accept any, must match live embedding

  double threshold = 0.65;
  double consensus_threshold = 0.65;
  double min_acceptable_similarity = 0.55;
  double high_similarity_override = 0.9;

  // Override mode scaling
  double override_threshold_scale = 0.85;
  double override_consensus_scale = 0.9;

  double variance_tolerance = 0.5;
  double override_variance_tolerance = 0.6;
  double range_tolerance = 0.3;
  double override_range_tolerance = 0.4;

  // Scoring coefficients
  double cosine_weight = 0.7;
  double euclidean_weight = 0.3;
  double variance_multiplier = 2.0;
  double range_multiplier = 3.0;
  double variance_penalty_weight = 0.3;
  double range_penalty_weight = 0.2;

  int required_checks = 4; // out of 5, standard mode

  // Cross-identity uniqueness
  double uniqueness_violation = 0.8;
  double uniqueness_critical = 0.9;
  double uniqueness_suspicious = 0.6;
  int uniqueness_suspicious_limit = 2;
};

struct LivenessConfig {
  std::size_t min_frames = 3;
  double min_detection_rate = 0.7;
  double movement_variance_threshold = 100.0; // px^2 of face area
  std::size_t short_sequence_frames = 5;
};

struct TemporalConfig {
  std::size_t max_history = 20;
  int rapid_window_sec = 3600;
  int rapid_max_attempts = 10;
  int history_window_sec = 86400;
  std::size_t min_variance_samples = 3;
  double confidence_variance_threshold = 0.1;
  double mediocre_confidence = 0.6;
  int min_failures = 3;
  double recovery_confidence = 0.5;
  int recovery_window_sec = 600;
};

struct ModelConfig {
  std::string models_dir = presenceguard::MODELS_DIR;
  std::string detection_model = "face_detection_yunet_2023mar.onnx";
  std::string recognition_model = "face_recognition_sface_2021dec.onnx";
  float detection_threshold = 0.9f;
  // Live captures scoring below this (0..1) are rejected before extraction
  double min_image_quality = 0.3;
  // Enrolled entries tagged with another model version are skipped; empty
  // accepts every entry.
  std::string required_model_version;
};

struct PathConfig {
  std::string users_dir = presenceguard::USERS_DIR;
  std::string ledger_dir = presenceguard::LEDGER_DIR;
};

struct LogConfig {
  std::string level = "info";
  std::string file = presenceguard::LOG_FILE; // empty: console only
};

// Immutable engine configuration, built once and handed to each component
// by const reference.
struct EngineConfig {
  NetworkConfig network;
  MatcherConfig matcher;
  LivenessConfig liveness;
  TemporalConfig temporal;
  ModelConfig models;
  PathConfig paths;
  LogConfig log;

  // Throws std::invalid_argument / std::out_of_range on non-numeric values.
  static EngineConfig fromIni(const std::string &path);
  static EngineConfig
  fromMap(const std::unordered_map<std::string, std::string> &ini);
};

} // namespace presenceguard
