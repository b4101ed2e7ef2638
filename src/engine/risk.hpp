#pragma once

namespace presenceguard {

enum class RiskLevel { Low, Medium, High };
enum class Recommendation { Allow, AdditionalVerification, Block };

const char *toString(RiskLevel level);
const char *toString(Recommendation rec);

} // namespace presenceguard
