#pragma once

// Shared constants for PresenceGuard
namespace presenceguard {
constexpr const char *SOCKET_PATH = "/run/presenceguard/socket";
constexpr const char *CONFIG_PATH = "/etc/presenceguard/config.ini";
constexpr const char *USERS_DIR = "/var/lib/presenceguard/users";
constexpr const char *LEDGER_DIR = "/var/lib/presenceguard/ledger";
constexpr const char *MODELS_DIR = "/etc/presenceguard/models";
constexpr const char *LOG_FILE = "/var/log/presenceguard/presenceguard.log";
} // namespace presenceguard
