#include "decision_json.hpp"

#include <opencv2/imgcodecs.hpp>

namespace presenceguard {

using json = nlohmann::json;

namespace {

// Risk fields of decisions that stopped before the temporal stage
const std::string NOT_ASSESSED = "NOT_ASSESSED";

json checksJson(const std::vector<SecurityCheck> &checks) {
  json out = json::array();
  for (const auto &c : checks) {
    out.push_back({{"name", c.name},
                   {"passed", c.passed},
                   {"critical", c.critical},
                   {"detail", c.detail}});
  }
  return out;
}

json uniquenessMatchesJson(const std::vector<UniquenessMatch> &matches) {
  json out = json::array();
  for (const auto &m : matches) {
    out.push_back({{"other_identity", m.other_identity},
                   {"embedding_index", m.embedding_index},
                   {"similarity", m.similarity},
                   {"severity", toString(m.severity)}});
  }
  return out;
}

std::string stringField(const json &obj, const char *key) {
  if (obj.is_object() && obj.contains(key) && obj[key].is_string())
    return obj[key].get<std::string>();
  return "";
}

} // namespace

json toJson(const NetworkResult &r) {
  json j = {{"network_verified", r.verified},
            {"ssid_verified", r.ssid_verified},
            {"ip_verified", r.ip_verified},
            {"hotspot_pattern", r.hotspot_pattern},
            {"hotspot_verified", r.hotspot_verified},
            {"security_score", r.security_score},
            {"matched_rule", r.matched_rule},
            {"matched_ssid", r.matched_ssid},
            {"ssid_match_type", r.ssid_match_type},
            {"matched_range", r.matched_range},
            {"client_ip", r.client_ip},
            {"checks_performed", r.checks_performed}};
  if (r.error != ErrorCode::None) {
    j["error"] = toString(r.error);
    j["error_detail"] = r.error_detail;
  }
  return j;
}

json toJson(const LivenessResult &r) {
  return {{"evaluated", r.evaluated},
          {"liveness_passed", r.passed},
          {"face_detection_rate", r.face_detection_rate},
          {"movement_detected", r.movement_detected},
          {"frames_processed", r.frames_processed},
          {"frames_decoded", r.frames_decoded},
          {"face_area_variance", r.face_area_variance},
          {"reason", r.reason}};
}

json toJson(const SimilarityAnalysis &a) {
  return {{"cosine_similarities", a.cosine_similarities},
          {"euclidean_similarities", a.euclidean_similarities},
          {"cosine_mean", a.cosine_mean},
          {"cosine_std", a.cosine_std},
          {"cosine_max", a.cosine_max},
          {"cosine_min", a.cosine_min},
          {"cosine_range", a.cosine_range},
          {"euclidean_mean", a.euclidean_mean},
          {"consensus_score", a.consensus_score},
          {"variance_penalty", a.variance_penalty},
          {"range_penalty", a.range_penalty},
          {"final_confidence", a.final_confidence}};
}

json toJson(const MatchResult &r) {
  json j = {{"match", r.match},
            {"confidence", r.confidence},
            {"raw_similarity", r.raw_similarity},
            {"consensus_score", r.consensus_score},
            {"threshold", r.base_threshold},
            {"effective_threshold", r.threshold_used},
            {"high_similarity_override", r.high_similarity_override},
            {"security_checks", checksJson(r.checks)},
            {"checks_passed", r.checks_passed},
            {"variance_penalty", r.analysis.variance_penalty},
            {"range_penalty", r.analysis.range_penalty},
            {"analysis", toJson(r.analysis)},
            {"total_embeddings_compared", r.total_embeddings_compared},
            {"excluded_embeddings", r.excluded_embeddings}};
  if (r.error != ErrorCode::None) {
    j["error"] = toString(r.error);
    j["error_detail"] = r.error_detail;
  }
  return j;
}

json toJson(const TemporalResult &r) {
  json patterns = json::array();
  for (const auto &p : r.patterns) {
    patterns.push_back({{"type", toString(p.type)},
                        {"severity", toString(p.severity)},
                        {"recommendation", toString(p.recommendation)},
                        {"details", p.details}});
  }
  return {{"risk_level", toString(r.risk_level)},
          {"suspicious_patterns", patterns},
          {"total_attempts_1h", r.total_attempts_1h},
          {"total_attempts_24h", r.total_attempts_24h},
          {"should_block", r.should_block},
          {"should_require_additional_verification",
           r.should_require_additional_verification},
          {"security_recommendation", toString(r.recommendation)}};
}

json toJson(const UniquenessResult &r) {
  return {{"is_unique", r.is_unique},
          {"risk_level", toString(r.risk_level)},
          {"cross_user_violations", uniquenessMatchesJson(r.violations)},
          {"suspicious_similarities", uniquenessMatchesJson(r.suspicious)},
          {"total_users_checked", r.identities_checked},
          {"security_recommendation", toString(r.recommendation)}};
}

json toJson(const VerificationDecision &d) {
  json trail = json::array();
  for (const auto &s : d.trail)
    trail.push_back({{"state", toString(s.state)}, {"note", s.note}});

  json details = {{"network_verification", toJson(d.network)},
                  {"trail", trail},
                  {"client_ip", d.client_ip},
                  {"timestamp", formatTimestamp(d.timestamp)},
                  {"enrolled_embeddings_excluded", d.enrolled_excluded},
                  {"history_records_skipped", d.history_skipped}};
  if (d.liveness)
    details["liveness_verification"] = toJson(*d.liveness);
  else
    details["liveness_verification"] = {{"liveness_passed", true},
                                        {"reason", d.liveness_note}};
  if (d.face)
    details["face_verification"] = toJson(*d.face);
  if (d.temporal)
    details["temporal_security"] = toJson(*d.temporal);
  if (d.additional_verification_recommended)
    details["additional_verification_recommended"] = true;

  json j = {{"identity", d.identity},
            {"success", d.verdict == Verdict::Allow},
            {"verdict", toString(d.verdict)},
            {"reason", d.reason},
            {"message", d.message},
            {"match", d.match},
            {"confidence", d.confidence},
            {"raw_similarity", d.raw_similarity},
            {"consensus_score", d.consensus_score},
            {"threshold", d.threshold},
            {"security_checks", checksJson(d.checks)},
            {"risk_level", NOT_ASSESSED},
            {"recommendation", NOT_ASSESSED},
            {"additional_verification_recommended",
             d.additional_verification_recommended},
            {"verification_details", details}};
  if (d.temporal) {
    j["risk_level"] = toString(d.risk_level);
    j["recommendation"] = toString(d.recommendation);
  }
  if (d.rejection_band)
    j["rejection_band"] = toString(*d.rejection_band);
  if (d.error != ErrorCode::None) {
    j["error"] = toString(d.error);
    j["error_detail"] = d.error_detail;
  }
  return j;
}

json ledgerRecord(const VerificationDecision &d) {
  json j = {{"timestamp", formatTimestamp(d.timestamp)},
            {"identity", d.identity},
            {"success", d.verdict == Verdict::Allow},
            {"verdict", toString(d.verdict)},
            {"reason", d.reason},
            {"location_verified", d.network.verified},
            {"network_ssid", d.network_ssid},
            {"device_ip", d.client_ip},
            {"liveness_passed", !d.liveness || d.liveness->passed},
            {"risk_level",
             d.temporal ? toString(d.risk_level) : NOT_ASSESSED}};
  // Stages that never scored leave confidence out of later statistics
  if (d.face && d.face->error == ErrorCode::None)
    j["confidence_score"] = d.confidence;
  return j;
}

Outcome<VerificationRequest>
parseVerificationRequest(const std::string &identity, const json &body,
                         std::size_t expected_dim) {
  if (!body.is_object())
    return Outcome<VerificationRequest>::failure(ErrorCode::MalformedInput,
                                                 "request body is not an object");
  VerificationRequest req;
  req.identity = identity;
  req.client_ip = stringField(body, "client_ip");

  if (body.contains("network") && body["network"].is_object()) {
    const json &net = body["network"];
    req.network.ssid = stringField(net, "ssid");
    req.network.bssid = stringField(net, "bssid");
    std::string type = stringField(net, "connection_type");
    if (!type.empty())
      req.network.connection_type = type;
  }

  if (body.contains("live_embedding")) {
    auto e = Embedding::fromJson(body["live_embedding"], expected_dim);
    if (!e)
      return Outcome<VerificationRequest>::failure(e.error(),
                                                   "live_embedding: " +
                                                       e.detail());
    req.live_embedding = std::move(e.value());
  } else {
    std::string path = stringField(body, "live_image_path");
    if (!path.empty())
      req.live_image = cv::imread(path, cv::IMREAD_COLOR);
  }

  if (body.contains("liveness")) {
    if (!body["liveness"].is_array())
      return Outcome<VerificationRequest>::failure(ErrorCode::MalformedInput,
                                                   "liveness is not an array");
    std::vector<FaceObservation> observations;
    for (const auto &o : body["liveness"]) {
      FaceObservation obs;
      if (!o.is_object()) {
        obs.decoded = false;
      } else {
        obs.face_present =
            o.contains("face_present") && o["face_present"].is_boolean() &&
            o["face_present"].get<bool>();
        if (o.contains("face_area") && o["face_area"].is_number())
          obs.face_area = o["face_area"].get<double>();
      }
      observations.push_back(obs);
    }
    if (!observations.empty())
      req.liveness = std::move(observations);
  } else if (body.contains("liveness_images") &&
             body["liveness_images"].is_array()) {
    for (const auto &p : body["liveness_images"]) {
      req.liveness_frames.push_back(p.is_string()
                                        ? cv::imread(p.get<std::string>(),
                                                     cv::IMREAD_COLOR)
                                        : cv::Mat());
    }
  }
  return Outcome<VerificationRequest>::success(std::move(req));
}

} // namespace presenceguard
