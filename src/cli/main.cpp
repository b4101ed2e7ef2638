#include "constants.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string send_cmd(const std::string &header, const std::string &body = "") {
  int sock = socket(AF_UNIX, SOCK_STREAM, 0);
  if (sock < 0) {
    std::cerr << "Error creating socket." << std::endl;
    return "";
  }

  struct sockaddr_un addr;
  memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  strncpy(addr.sun_path, presenceguard::SOCKET_PATH,
          sizeof(addr.sun_path) - 1);

  if (connect(sock, (struct sockaddr *)&addr, sizeof(addr)) == -1) {
    std::cerr << "Could not connect to service at "
              << presenceguard::SOCKET_PATH << ". Is presenceguardd running?"
              << std::endl;
    close(sock);
    return "";
  }

  std::string payload = header + "\n" + body;
  size_t sent = 0;
  while (sent < payload.size()) {
    ssize_t n = send(sock, payload.data() + sent, payload.size() - sent,
                     MSG_NOSIGNAL);
    if (n <= 0) {
      std::cerr << "Error sending request." << std::endl;
      close(sock);
      return "";
    }
    sent += static_cast<size_t>(n);
  }
  // Signals end of request to the service
  shutdown(sock, SHUT_WR);

  std::string response;
  char buffer[4096];
  ssize_t bytes_read;
  while ((bytes_read = read(sock, buffer, sizeof(buffer))) > 0) {
    response.append(buffer, static_cast<size_t>(bytes_read));
  }
  close(sock);
  return response;
}

bool read_file(const std::string &path, std::string &out) {
  std::ifstream f(path);
  if (!f.is_open()) {
    std::cerr << "Cannot open " << path << std::endl;
    return false;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

// Pretty-prints JSON responses, passes plain ones through.
int print_response(const std::string &resp) {
  if (resp.empty()) {
    std::cerr << "Error: Connection closed by service (empty response)."
              << std::endl;
    return 1;
  }
  json j = json::parse(resp, nullptr, false);
  if (j.is_discarded()) {
    std::cout << "Response: " << resp << std::endl;
    return resp.rfind("ERROR", 0) == 0 ? 1 : 0;
  }
  std::cout << j.dump(2) << std::endl;
  if (j.contains("success") && j["success"].is_boolean())
    return j["success"].get<bool>() ? 0 : 2;
  return 0;
}

void print_help() {
  std::cout
#ifdef PRESENCEGUARD_VERSION
      << "PresenceGuard CLI Tool v" << PRESENCEGUARD_VERSION << "\n"
#else
      << "PresenceGuard CLI Tool vUnknown\n"
#endif
      << "Usage:\n"
      << "  presenceguard verify <identity> <request.json>   Run a "
         "verification\n"
      << "  presenceguard unique <identity> <embedding.json> Check face "
         "uniqueness\n"
      << "  presenceguard requirements                       Show network "
         "requirements\n"
      << "  presenceguard version                            Service "
         "version\n"
      << "  presenceguard help                               Show this help\n"
      << "Exit status: 0 allowed, 2 denied or blocked, 1 error.\n";
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cout
        << "Usage: presenceguard <verify|unique|requirements|version|help> "
           "[args]"
        << std::endl;
    return 1;
  }

  std::string op = argv[1];

  if (op == "verify" || op == "unique") {
    if (argc < 4) {
      std::cout << "Usage: presenceguard " << op << " <identity> <file.json>"
                << std::endl;
      return 1;
    }
    std::string body;
    if (!read_file(argv[3], body))
      return 1;

    if (op == "unique") {
      // Accept a bare embedding array as well
      json j = json::parse(body, nullptr, false);
      if (!j.is_discarded() && j.is_array())
        body = json{{"live_embedding", j}}.dump();
    }
    std::string cmd = (op == "verify" ? "VERIFY " : "UNIQUENESS ");
    return print_response(send_cmd(cmd + argv[2], body));
  } else if (op == "requirements") {
    return print_response(send_cmd("NETWORK_REQUIREMENTS"));
  } else if (op == "version") {
    return print_response(send_cmd("GET_VERSION"));
  } else if (op == "help" || op == "--help" || op == "-h") {
    print_help();
    return 0;
  }

  std::cout << "Unknown command: " << op << std::endl;
  print_help();
  return 1;
}
