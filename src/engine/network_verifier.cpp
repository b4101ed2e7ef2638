#include "network_verifier.hpp"

#include "logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <sys/socket.h>

namespace presenceguard {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

bool prefixMatches(const IpAddress &ip, const IpAddress &network, int prefix) {
  if (ip.family != network.family)
    return false;
  int full_bytes = prefix / 8;
  int rem_bits = prefix % 8;
  if (std::memcmp(ip.bytes.data(), network.bytes.data(), full_bytes) != 0)
    return false;
  if (rem_bits == 0)
    return true;
  std::uint8_t mask = static_cast<std::uint8_t>(0xFF << (8 - rem_bits));
  return (ip.bytes[full_bytes] & mask) == (network.bytes[full_bytes] & mask);
}

std::vector<CidrRange> parseRanges(const std::vector<std::string> &texts,
                                   const char *what) {
  std::vector<CidrRange> ranges;
  for (const auto &t : texts) {
    auto r = CidrRange::parse(t);
    if (!r) {
      Logger::log(LogLevel::WARN, std::string("Ignoring invalid ") + what +
                                      " '" + t + "': " + r.detail());
      continue;
    }
    ranges.push_back(r.value());
  }
  return ranges;
}

} // namespace

std::size_t IpAddress::length() const { return family == AF_INET6 ? 16 : 4; }

Outcome<IpAddress> parseIpAddress(const std::string &text) {
  std::string s = trim(text);
  IpAddress ip;
  if (s.empty())
    return Outcome<IpAddress>::failure(ErrorCode::MalformedInput,
                                       "empty IP address");
  if (inet_pton(AF_INET, s.c_str(), ip.bytes.data()) == 1) {
    ip.family = AF_INET;
    return Outcome<IpAddress>::success(ip);
  }
  if (inet_pton(AF_INET6, s.c_str(), ip.bytes.data()) == 1) {
    ip.family = AF_INET6;
    return Outcome<IpAddress>::success(ip);
  }
  return Outcome<IpAddress>::failure(ErrorCode::MalformedInput,
                                     "malformed IP address '" + s + "'");
}

bool isPrivateAddress(const IpAddress &ip) {
  static const std::vector<CidrRange> private_ranges =
      parseRanges({"10.0.0.0/8", "172.16.0.0/12", "192.168.0.0/16",
                   "127.0.0.0/8", "169.254.0.0/16", "fc00::/7", "fe80::/10",
                   "::1/128"},
                  "private range");
  return std::any_of(private_ranges.begin(), private_ranges.end(),
                     [&ip](const CidrRange &r) { return r.contains(ip); });
}

Outcome<CidrRange> CidrRange::parse(const std::string &text) {
  std::string s = trim(text);
  CidrRange range;
  range.text = s;

  auto slash = s.find('/');
  auto addr = parseIpAddress(s.substr(0, slash));
  if (!addr)
    return Outcome<CidrRange>::failure(ErrorCode::MalformedInput,
                                       addr.detail());
  range.network = addr.value();

  int max_prefix = static_cast<int>(range.network.length() * 8);
  if (slash == std::string::npos) {
    range.prefix = max_prefix;
  } else {
    std::string bits = s.substr(slash + 1);
    if (bits.empty() || bits.size() > 3 ||
        !std::all_of(bits.begin(), bits.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
      return Outcome<CidrRange>::failure(ErrorCode::MalformedInput,
                                         "bad prefix length in '" + s + "'");
    range.prefix = std::stoi(bits);
    if (range.prefix > max_prefix)
      return Outcome<CidrRange>::failure(ErrorCode::MalformedInput,
                                         "prefix too long in '" + s + "'");
  }
  return Outcome<CidrRange>::success(range);
}

bool CidrRange::contains(const IpAddress &ip) const {
  return prefixMatches(ip, network, prefix);
}

NetworkVerifier::NetworkVerifier(NetworkConfig config)
    : config_(std::move(config)) {
  allowed_ranges_ = parseRanges(config_.allowed_ip_ranges, "allowed IP range");
  hotspot_subnets_ = parseRanges(config_.hotspot_subnets, "hotspot subnet");
}

bool NetworkVerifier::isHotspotSsid(const std::string &ssid) const {
  std::string lower = toLower(ssid);
  if (lower.empty())
    return false;
  for (const auto &pattern : config_.hotspot_patterns) {
    if (lower.find(toLower(pattern)) != std::string::npos)
      return true;
  }
  return false;
}

NetworkResult NetworkVerifier::verify(const NetworkContext &context,
                                      const std::string &client_ip) const {
  NetworkResult result;
  result.client_ip = client_ip;
  std::string ssid = trim(context.ssid);

  // SSID
  if (!ssid.empty()) {
    result.checks_performed.push_back("ssid_check");
    std::string ssid_lower = toLower(ssid);
    for (const auto &allowed : config_.allowed_ssids) {
      if (allowed == "*") {
        result.ssid_verified = true;
        result.matched_ssid = allowed;
        result.ssid_match_type = "wildcard";
        break;
      }
      if (ssid_lower == toLower(allowed)) {
        result.ssid_verified = true;
        result.matched_ssid = allowed;
        result.ssid_match_type = "exact";
        break;
      }
    }
    result.hotspot_pattern = isHotspotSsid(ssid);
    if (!result.ssid_verified && result.hotspot_pattern) {
      result.ssid_verified = true;
      result.matched_ssid = ssid;
      result.ssid_match_type = "hotspot_pattern";
    }
  }

  // IP range
  result.checks_performed.push_back("ip_range_check");
  auto ip = parseIpAddress(client_ip);
  if (!ip) {
    // Malformed IP downgrades to "unverified", never a hard failure
    result.error = ip.error();
    result.error_detail = ip.detail();
    Logger::log(LogLevel::WARN, "Network: " + ip.detail());
  } else {
    for (const auto &range : allowed_ranges_) {
      if (range.contains(ip.value())) {
        result.ip_verified = true;
        result.matched_range = range.text;
        break;
      }
    }

    // Hotspot heuristic: pattern + private address + default hotspot subnet
    if (result.hotspot_pattern) {
      result.checks_performed.push_back("hotspot_pattern_check");
      bool in_subnet = false;
      for (const auto &subnet : hotspot_subnets_) {
        if (subnet.contains(ip.value())) {
          in_subnet = true;
          if (result.matched_range.empty())
            result.matched_range = subnet.text;
          break;
        }
      }
      result.hotspot_verified = in_subnet && isPrivateAddress(ip.value());
    }
  }

  result.verified =
      result.ssid_verified || result.ip_verified || result.hotspot_verified;

  double score = 0.0;
  if (result.ssid_verified)
    score += config_.ssid_weight;
  if (result.ip_verified)
    score += config_.ip_weight;
  if (result.hotspot_verified)
    score += config_.hotspot_weight;
  result.security_score = std::min(score, 1.0);

  if (result.ssid_verified)
    result.matched_rule = "ssid_" + result.ssid_match_type;
  else if (result.ip_verified)
    result.matched_rule = "ip_range";
  else if (result.hotspot_verified)
    result.matched_rule = "hotspot_subnet";

  Logger::log(LogLevel::INFO,
              "Network: ssid='" + ssid + "' ip=" + client_ip +
                  " ssid_ok=" + std::to_string(result.ssid_verified) +
                  " ip_ok=" + std::to_string(result.ip_verified) +
                  " hotspot_ok=" + std::to_string(result.hotspot_verified) +
                  " score=" + std::to_string(result.security_score));
  return result;
}

nlohmann::json NetworkVerifier::requirements() const {
  nlohmann::json ranges = nlohmann::json::array();
  for (const auto &r : allowed_ranges_)
    ranges.push_back(r.text);

  return {
      {"allowed_ssids", config_.allowed_ssids},
      {"allowed_ip_ranges", ranges},
      {"hotspot_patterns", config_.hotspot_patterns},
      {"verification_methods",
       {"SSID verification", "IP range verification",
        "Mobile hotspot pattern matching"}},
      {"requirements",
       {{"wifi_connection", "Connect to allowed Wi-Fi network"},
        {"location", "Must be within network coverage area"},
        {"device", "Device must be on authorized network"}}}};
}

} // namespace presenceguard
