#include "splicenet/socket-ops.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>

#include <csignal>
#include <cstring>
#include <string>

#include "splicenet/base-fd.hpp"
#include "splicenet/test-util.hpp"

namespace splicenet {

TEST(SocketOps, FlagsOnBadFdFail) {
  EXPECT_FALSE(SetNonBlocking(-1));
  EXPECT_FALSE(SetCloseOnExec(-1));
  EXPECT_FALSE(SetTcpNoDelay(-1));
  EXPECT_FALSE(ShutdownRead(-1));
  EXPECT_FALSE(ShutdownWrite(-1));
  EXPECT_FALSE(ShutdownReadWrite(-1));
}

TEST(SocketOps, SetTcpNoDelayOnTcpSocket) {
  BaseFd fd(::socket(AF_INET, SOCK_STREAM, 0));
  ASSERT_TRUE(fd);
  ASSERT_TRUE(SetTcpNoDelay(fd.fd()));
  int val = 0;
  socklen_t len = sizeof(val);
  ASSERT_EQ(::getsockopt(fd.fd(), IPPROTO_TCP, TCP_NODELAY, &val, &len), 0);
  EXPECT_NE(val, 0);
}

TEST(SocketOps, GetSocketErrorOnFreshSocketIsZero) {
  BaseFd fd(::socket(AF_INET, SOCK_STREAM, 0));
  ASSERT_TRUE(fd);
  EXPECT_EQ(GetSocketError(fd.fd()), 0);
}

TEST(SocketOps, FormatIpv4Address) {
  sockaddr_storage storage{};
  auto* addr = reinterpret_cast<sockaddr_in*>(&storage);
  addr->sin_family = AF_INET;
  addr->sin_port = htons(8080);
  ASSERT_EQ(::inet_pton(AF_INET, "127.0.0.1", &addr->sin_addr), 1);
  EXPECT_EQ(FormatAddress(storage), "127.0.0.1:8080");
}

TEST(SocketOps, FormatIpv6Address) {
  sockaddr_storage storage{};
  auto* addr = reinterpret_cast<sockaddr_in6*>(&storage);
  addr->sin6_family = AF_INET6;
  addr->sin6_port = htons(443);
  ASSERT_EQ(::inet_pton(AF_INET6, "::1", &addr->sin6_addr), 1);
  EXPECT_EQ(FormatAddress(storage), "[::1]:443");
}

TEST(SocketOps, FormatUnixAddress) {
  sockaddr_storage storage{};
  auto* addr = reinterpret_cast<sockaddr_un*>(&storage);
  addr->sun_family = AF_UNIX;
  std::strcpy(addr->sun_path, "/tmp/splicenet.sock");
  EXPECT_EQ(FormatAddress(storage), "/tmp/splicenet.sock");
}

TEST(SocketOps, NetworkNameOfSockets) {
  EXPECT_EQ(NetworkName(-1), "unknown");

  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
  BaseFd a(sv[0]);
  BaseFd b(sv[1]);
  EXPECT_EQ(NetworkName(a.fd()), "unix");

  auto pair = test::MakeTcpPair();
  EXPECT_EQ(NetworkName(pair.client.fd()), "tcp");
}

TEST(SocketOps, LocalAndPeerAddressesOfLoopbackPair) {
  auto pair = test::MakeTcpPair();
  sockaddr_storage local{};
  sockaddr_storage peer{};
  ASSERT_TRUE(GetLocalAddress(pair.client.fd(), local));
  ASSERT_TRUE(GetPeerAddress(pair.server.fd(), peer));
  EXPECT_EQ(FormatAddress(local), FormatAddress(peer));
}

TEST(SocketOps, IgnoreSigPipe) {
  IgnoreSigPipe();
  struct sigaction current{};
  ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &current), 0);
  EXPECT_EQ(current.sa_handler, SIG_IGN);
}

}  // namespace splicenet
