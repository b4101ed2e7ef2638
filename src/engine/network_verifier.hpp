#pragma once

#include "engine_config.hpp"
#include "errors.hpp"

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace presenceguard {

struct IpAddress {
  int family = 0; // AF_INET or AF_INET6
  std::array<std::uint8_t, 16> bytes{};

  std::size_t length() const;
};

// Parses dotted IPv4 or textual IPv6 (surrounding blanks allowed).
[[nodiscard]] Outcome<IpAddress> parseIpAddress(const std::string &text);

// RFC1918, loopback, link-local and IPv6 ULA.
bool isPrivateAddress(const IpAddress &ip);

struct CidrRange {
  IpAddress network;
  int prefix = 0;
  std::string text;

  [[nodiscard]] static Outcome<CidrRange> parse(const std::string &text);
  bool contains(const IpAddress &ip) const;
};

struct NetworkContext {
  std::string ssid;
  std::string bssid; // optional, informational
  std::string connection_type = "wifi";
};

struct NetworkResult {
  bool verified = false;
  bool ssid_verified = false;
  bool ip_verified = false;
  bool hotspot_pattern = false;
  bool hotspot_verified = false;
  double security_score = 0.0;

  std::string matched_rule; // first rule that verified, "" if none
  std::string matched_ssid;
  std::string ssid_match_type; // exact | wildcard | hotspot_pattern
  std::string matched_range;
  std::string client_ip;
  std::vector<std::string> checks_performed;

  ErrorCode error = ErrorCode::None;
  std::string error_detail;
};

// Classifies a claimed network context against the configured allow-lists.
// Pure function of its inputs and the configuration.
class NetworkVerifier {
public:
  explicit NetworkVerifier(NetworkConfig config);

  [[nodiscard]] NetworkResult verify(const NetworkContext &context,
                                     const std::string &client_ip) const;

  bool isHotspotSsid(const std::string &ssid) const;

  // Current network requirements, for clients that want to guide the user.
  nlohmann::json requirements() const;

private:
  NetworkConfig config_;
  std::vector<CidrRange> allowed_ranges_;
  std::vector<CidrRange> hotspot_subnets_;
};

} // namespace presenceguard
