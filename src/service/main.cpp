#include "constants.hpp"
#include "decision_json.hpp"
#include "engine_config.hpp"
#include "face_vision.hpp"
#include "file_stores.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "request_reader.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace presenceguard;

namespace {

// Global shutdown flag
std::atomic<bool> g_running(true);

constexpr std::size_t MAX_REQUEST_BYTES = 1024 * 1024;
// A client that never half-closes must not stall the accept loop
constexpr int REQUEST_TIMEOUT_SEC = 5;

void signal_handler(int signum) {
  (void)signum;
  g_running = false;
}

struct Service {
  EngineConfig config;
  FileEnrollmentStore store;
  FileAttemptLedger ledger;
  FaceModels models;
  SFaceExtractor extractor;
  YuNetFaceRegionDetector detector;
  VerificationOrchestrator orchestrator;

  explicit Service(const EngineConfig &cfg)
      : config(cfg),
        store(cfg.paths.users_dir, cfg.matcher.embedding_dim,
              cfg.models.required_model_version),
        ledger(cfg.paths.ledger_dir), models(cfg.models), extractor(models),
        detector(models),
        orchestrator(config, store, ledger, &extractor, &detector) {}
};

std::string handle_verify(Service &svc, const std::string &identity,
                          const json &body) {
  auto request = parseVerificationRequest(identity, body,
                                          svc.config.matcher.embedding_dim);
  if (!request) {
    Logger::log(LogLevel::WARN, "Rejected malformed request for " + identity +
                                    ": " + request.detail());
    return json{{"success", false},
                {"verdict", "DENY"},
                {"reason", "malformed_input"},
                {"error", toString(request.error())},
                {"error_detail", request.detail()}}
        .dump();
  }

  VerificationDecision decision = svc.orchestrator.verify(request.value());
  svc.ledger.append(identity, ledgerRecord(decision));
  return toJson(decision).dump();
}

std::string handle_uniqueness(Service &svc, const std::string &identity,
                              const json &body) {
  if (!body.is_object() || !body.contains("live_embedding"))
    return "ERROR Missing live_embedding";
  auto live = Embedding::fromJson(body["live_embedding"],
                                  svc.config.matcher.embedding_dim);
  if (!live)
    return "ERROR " + live.detail();
  UniquenessResult result = svc.orchestrator.faceMatcher().checkUniqueness(
      identity, live.value(), svc.store.getAllEmbeddings());
  return toJson(result).dump();
}

void handle_client(int client_fd, Service &svc) {
  std::string request;
  if (!readRequest(client_fd, request, MAX_REQUEST_BYTES,
                   REQUEST_TIMEOUT_SEC)) {
    Logger::log(LogLevel::WARN, "Dropping unreadable request");
    close(client_fd);
    return;
  }

  // Protocol: "COMMAND [identity]\n<json body>"
  // e.g. "VERIFY alice\n{...}"
  //      "UNIQUENESS alice\n{...}"
  //      "NETWORK_REQUIREMENTS"
  //      "GET_VERSION"
  std::string header = request.substr(0, request.find('\n'));
  std::string body_text =
      header.size() < request.size() ? request.substr(header.size() + 1) : "";

  std::istringstream iss(header);
  std::string cmd, identity;
  iss >> cmd >> identity;
  Logger::log(LogLevel::DEBUG, "Received Request: " + header);

  std::string response = "ERROR Unknown Command";

  try {
    if (cmd == "VERIFY" || cmd == "UNIQUENESS") {
      json body = json::parse(body_text, nullptr, false);
      if (!isValidIdentity(identity)) {
        Logger::log(LogLevel::WARN, "Security Warn: Invalid identity string");
        response = "ERROR Invalid identity";
      } else if (body.is_discarded()) {
        response = "ERROR Malformed JSON body";
      } else if (cmd == "VERIFY") {
        response = handle_verify(svc, identity, body);
      } else {
        response = handle_uniqueness(svc, identity, body);
      }
    } else if (cmd == "NETWORK_REQUIREMENTS") {
      response = svc.orchestrator.networkVerifier().requirements().dump();
    } else if (cmd == "GET_VERSION") {
#ifdef PRESENCEGUARD_VERSION
      response = PRESENCEGUARD_VERSION;
#else
      response = "Unknown";
#endif
    }
  } catch (const StoreError &e) {
    Logger::log(LogLevel::ERROR, "Store failure handling " + cmd + ": " +
                                     e.what());
    response = "ERROR Store unavailable";
  } catch (const std::exception &e) {
    Logger::log(LogLevel::ERROR, "Exception handling " + cmd + ": " + e.what());
    response = "ERROR Exception";
  }

  send(client_fd, response.c_str(), response.length(), MSG_NOSIGNAL);
  close(client_fd);
}

} // namespace

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  std::string config_path = presenceguard::CONFIG_PATH;
  if (argc > 1) {
    config_path = argv[1];
  } else if (!fs::exists(config_path)) {
    // Fallback to local config for dev
    config_path = "config.ini";
  }

  EngineConfig config;
  try {
    config = EngineConfig::fromIni(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Invalid configuration in " << config_path << ": "
              << e.what() << std::endl;
    return 1;
  }

  Logger::setLevel(Logger::parseLevel(config.log.level));
  Logger::setLogFile(config.log.file);
  Logger::log(LogLevel::INFO, "Starting PresenceGuard Service...");
  Logger::log(LogLevel::INFO, "Loaded Config: " + config_path);

  Service svc(config);
  if (!svc.models.load())
    Logger::log(LogLevel::WARN,
                "Face models not loaded; image requests will be rejected");
  Logger::log(LogLevel::INFO,
              "Recognizer model version: " + svc.models.modelVersion());

  std::string socket_path = presenceguard::SOCKET_PATH;
  fs::path p(socket_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
  }

  int server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd < 0) {
    perror("socket failed");
    return 1;
  }

  struct sockaddr_un address;
  std::memset(&address, 0, sizeof(address));
  address.sun_family = AF_UNIX;
  strncpy(address.sun_path, socket_path.c_str(), sizeof(address.sun_path) - 1);

  unlink(socket_path.c_str()); // Remove old socket
  if (bind(server_fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
    perror("bind failed");
    close(server_fd);
    return 1;
  }

  // Owner and group only; front-ends run in the service group
  chmod(socket_path.c_str(), 0660);

  if (listen(server_fd, 16) < 0) {
    perror("listen");
    close(server_fd);
    return 1;
  }

  Logger::log(LogLevel::INFO, "Listening on " + socket_path);

  while (g_running) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(server_fd, &readfds);

    // Timeout for select to allow checking g_running
    struct timeval timeout;
    timeout.tv_sec = 1;
    timeout.tv_usec = 0;

    int activity = select(server_fd + 1, &readfds, NULL, NULL, &timeout);
    if (activity < 0 && errno != EINTR) {
      Logger::log(LogLevel::ERROR,
                  std::string("select failed: ") + std::strerror(errno));
      break;
    }

    if (g_running && activity > 0 && FD_ISSET(server_fd, &readfds)) {
      int client_fd = accept(server_fd, NULL, NULL);
      if (client_fd >= 0) {
        // Each call is independent; handled inline
        handle_client(client_fd, svc);
      }
    }
  }

  close(server_fd);
  unlink(socket_path.c_str());
  Logger::log(LogLevel::INFO, "Stopped.");
  return 0;
}
