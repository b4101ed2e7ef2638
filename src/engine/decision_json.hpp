#pragma once

#include "orchestrator.hpp"

#include <nlohmann/json.hpp>

namespace presenceguard {

nlohmann::json toJson(const NetworkResult &r);
nlohmann::json toJson(const LivenessResult &r);
nlohmann::json toJson(const SimilarityAnalysis &a);
nlohmann::json toJson(const MatchResult &r);
nlohmann::json toJson(const TemporalResult &r);
nlohmann::json toJson(const UniquenessResult &r);
nlohmann::json toJson(const VerificationDecision &d);

// Compact record appended to the attempt ledger; readable back by
// parseAttemptRecord().
nlohmann::json ledgerRecord(const VerificationDecision &d);

// Boundary parse of a daemon VERIFY body:
//   {"network": {"ssid", "bssid", "connection_type"}, "client_ip",
//    "live_embedding" | "live_image_path",
//    "liveness": [{"face_present", "face_area"}] | "liveness_images": [path]}
// Images that fail to decode become empty frames.
[[nodiscard]] Outcome<VerificationRequest>
parseVerificationRequest(const std::string &identity,
                         const nlohmann::json &body,
                         std::size_t expected_dim = 0);

} // namespace presenceguard
