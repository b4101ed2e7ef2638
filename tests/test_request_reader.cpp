#include "request_reader.hpp"

#include <gtest/gtest.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using namespace presenceguard;

namespace {

class SocketPairTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  }

  void TearDown() override {
    close(fds[0]);
    close(fds[1]);
  }

  void sendAll(const std::string &data) {
    ASSERT_EQ(write(fds[1], data.data(), data.size()),
              static_cast<ssize_t>(data.size()));
  }

  int fds[2] = {-1, -1};
};

} // namespace

TEST_F(SocketPairTest, ReadsUntilHalfClose) {
  sendAll("VERIFY alice\n{}");
  shutdown(fds[1], SHUT_WR);

  std::string request;
  EXPECT_TRUE(readRequest(fds[0], request, 1024, 1));
  EXPECT_EQ(request, "VERIFY alice\n{}");
}

TEST_F(SocketPairTest, SilentClientTimesOut) {
  sendAll("VERIFY alice\n");

  std::string request;
  EXPECT_FALSE(readRequest(fds[0], request, 1024, 1));
  EXPECT_EQ(request, "VERIFY alice\n");
}

TEST_F(SocketPairTest, EmptyRequestFails) {
  shutdown(fds[1], SHUT_WR);

  std::string request;
  EXPECT_FALSE(readRequest(fds[0], request, 1024, 1));
}

TEST_F(SocketPairTest, OversizedRequestFails) {
  sendAll(std::string(64, 'x'));
  shutdown(fds[1], SHUT_WR);

  std::string request;
  EXPECT_FALSE(readRequest(fds[0], request, 32, 1));
}
