#include "engine_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace presenceguard {

std::unordered_map<std::string, std::string>
parse_ini(const std::string &path) {
  std::unordered_map<std::string, std::string> result;
  std::ifstream file(path);
  if (!file.is_open())
    return result;

  std::string line, current_section;
  while (std::getline(file, line)) {
    // Trim
    line.erase(0, line.find_first_not_of(" \t\r"));
    if (line.empty() || line[0] == ';' || line[0] == '#')
      continue;
    auto last = line.find_last_not_of(" \t\r");
    if (last != std::string::npos)
      line.erase(last + 1);

    if (line[0] == '[' && line.back() == ']') {
      current_section = line.substr(1, line.size() - 2);
    } else {
      size_t eq = line.find('=');
      if (eq != std::string::npos) {
        std::string key = line.substr(0, eq);
        key.erase(key.find_last_not_of(" \t") + 1);
        std::string val = line.substr(eq + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        result[current_section + "." + key] = val;
      }
    }
  }
  return result;
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t"));
    auto last = item.find_last_not_of(" \t");
    if (last == std::string::npos)
      continue;
    item.erase(last + 1);
    out.push_back(item);
  }
  return out;
}

EngineConfig EngineConfig::fromIni(const std::string &path) {
  return fromMap(parse_ini(path));
}

EngineConfig
EngineConfig::fromMap(const std::unordered_map<std::string, std::string> &ini) {
  EngineConfig config;

  auto has = [&ini](const std::string &key) { return ini.count(key) > 0; };
  auto get = [&ini](const std::string &key,
                    const std::string &def = "") -> std::string {
    auto it = ini.find(key);
    return it != ini.end() ? it->second : def;
  };
  auto num = [&](const std::string &key, double &out) {
    if (has(key))
      out = std::stod(get(key));
  };
  auto integer = [&](const std::string &key, int &out) {
    if (has(key))
      out = std::stoi(get(key));
  };
  auto size = [&](const std::string &key, std::size_t &out) {
    if (!has(key))
      return;
    std::string value = get(key);
    // stoul accepts "-1" and wraps it
    if (value.find('-') != std::string::npos)
      throw std::invalid_argument(key + " must not be negative");
    out = static_cast<std::size_t>(std::stoul(value));
  };
  auto list = [&](const std::string &key, std::vector<std::string> &out) {
    if (has(key))
      out = split_list(get(key));
  };

  // Network
  NetworkConfig &net = config.network;
  list("Network.allowed_ssids", net.allowed_ssids);
  list("Network.allowed_ip_ranges", net.allowed_ip_ranges);
  list("Network.hotspot_patterns", net.hotspot_patterns);
  list("Network.hotspot_subnets", net.hotspot_subnets);
  num("Network.ssid_weight", net.ssid_weight);
  num("Network.ip_weight", net.ip_weight);
  num("Network.hotspot_weight", net.hotspot_weight);

  // Matcher
  MatcherConfig &m = config.matcher;
  size("Matcher.embedding_dim", m.embedding_dim);
  num("Matcher.threshold", m.threshold);
  num("Matcher.consensus_threshold", m.consensus_threshold);
  num("Matcher.min_acceptable_similarity", m.min_acceptable_similarity);
  num("Matcher.high_similarity_override", m.high_similarity_override);
  num("Matcher.override_threshold_scale", m.override_threshold_scale);
  num("Matcher.override_consensus_scale", m.override_consensus_scale);
  num("Matcher.variance_tolerance", m.variance_tolerance);
  num("Matcher.override_variance_tolerance", m.override_variance_tolerance);
  num("Matcher.range_tolerance", m.range_tolerance);
  num("Matcher.override_range_tolerance", m.override_range_tolerance);
  num("Matcher.cosine_weight", m.cosine_weight);
  num("Matcher.euclidean_weight", m.euclidean_weight);
  num("Matcher.variance_multiplier", m.variance_multiplier);
  num("Matcher.range_multiplier", m.range_multiplier);
  num("Matcher.variance_penalty_weight", m.variance_penalty_weight);
  num("Matcher.range_penalty_weight", m.range_penalty_weight);
  integer("Matcher.required_checks", m.required_checks);
  num("Matcher.uniqueness_violation", m.uniqueness_violation);
  num("Matcher.uniqueness_critical", m.uniqueness_critical);
  num("Matcher.uniqueness_suspicious", m.uniqueness_suspicious);
  integer("Matcher.uniqueness_suspicious_limit", m.uniqueness_suspicious_limit);

  // Liveness
  LivenessConfig &l = config.liveness;
  size("Liveness.min_frames", l.min_frames);
  num("Liveness.min_detection_rate", l.min_detection_rate);
  num("Liveness.movement_variance_threshold", l.movement_variance_threshold);
  size("Liveness.short_sequence_frames", l.short_sequence_frames);

  // Temporal
  TemporalConfig &t = config.temporal;
  size("Temporal.max_history", t.max_history);
  integer("Temporal.rapid_window_sec", t.rapid_window_sec);
  integer("Temporal.rapid_max_attempts", t.rapid_max_attempts);
  integer("Temporal.history_window_sec", t.history_window_sec);
  size("Temporal.min_variance_samples", t.min_variance_samples);
  num("Temporal.confidence_variance_threshold",
      t.confidence_variance_threshold);
  num("Temporal.mediocre_confidence", t.mediocre_confidence);
  integer("Temporal.min_failures", t.min_failures);
  num("Temporal.recovery_confidence", t.recovery_confidence);
  integer("Temporal.recovery_window_sec", t.recovery_window_sec);

  // Models
  config.models.models_dir = get("Models.models_dir", config.models.models_dir);
  config.models.detection_model =
      get("Models.detection_model", config.models.detection_model);
  config.models.recognition_model =
      get("Models.recognition_model", config.models.recognition_model);
  if (has("Models.detection_threshold"))
    config.models.detection_threshold =
        std::stof(get("Models.detection_threshold"));
  num("Models.min_image_quality", config.models.min_image_quality);
  config.models.required_model_version =
      get("Models.required_model_version", "");

  // Paths
  config.paths.users_dir = get("Paths.users_dir", config.paths.users_dir);
  config.paths.ledger_dir = get("Paths.ledger_dir", config.paths.ledger_dir);

  // Log
  config.log.level = get("Log.level", config.log.level);
  config.log.file = get("Log.file", config.log.file);

  return config;
}

} // namespace presenceguard
