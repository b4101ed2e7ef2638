#include "request_reader.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace presenceguard {

bool readRequest(int client_fd, std::string &out, std::size_t max_bytes,
                 int timeout_sec) {
  struct timeval timeout;
  timeout.tv_sec = timeout_sec;
  timeout.tv_usec = 0;
  if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout,
                 sizeof(timeout)) < 0)
    return false;

  char buffer[4096];
  while (out.size() < max_bytes) {
    ssize_t n = read(client_fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      // EAGAIN/EWOULDBLOCK: receive timeout expired
      return false;
    }
    if (n == 0)
      break;
    out.append(buffer, static_cast<size_t>(n));
  }
  return !out.empty() && out.size() < max_bytes;
}

} // namespace presenceguard
