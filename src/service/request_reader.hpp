#pragma once

#include <cstddef>
#include <string>

namespace presenceguard {

// Reads one request from a connected client until it half-closes.
// Fails on an empty or oversized request, or when the client goes quiet
// for timeout_sec seconds.
bool readRequest(int client_fd, std::string &out, std::size_t max_bytes,
                 int timeout_sec);

} // namespace presenceguard
