#include "splicenet/socket.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>

#include "splicenet/connection.hpp"
#include "splicenet/tcp-connector.hpp"

namespace splicenet {

TEST(Socket, DefaultIsClosed) {
  Socket sock;
  EXPECT_FALSE(sock);
}

TEST(Socket, UnknownTypeThrows) {
  EXPECT_THROW(Socket(static_cast<Socket::Type>(42)), std::invalid_argument);
}

TEST(Socket, BindAndListenOnEphemeralPort) {
  Socket sock(Socket::Type::Stream);
  ASSERT_TRUE(sock);
  uint16_t port = 0;
  sock.bindAndListen(false, true, port);
  EXPECT_NE(port, 0);

  int acceptConn = 0;
  socklen_t len = sizeof(acceptConn);
  ASSERT_EQ(::getsockopt(sock.fd(), SOL_SOCKET, SO_ACCEPTCONN, &acceptConn, &len), 0);
  EXPECT_EQ(acceptConn, 1);
}

TEST(Socket, AcceptsDialedConnection) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  sock.bindAndListen(false, true, port);

  Connection client = DialTCP("127.0.0.1", port);
  ASSERT_TRUE(client);
  Connection server(sock);
  ASSERT_TRUE(server);
  EXPECT_EQ(server.network(), "tcp");
  EXPECT_FALSE(server.remoteAddress().empty());
}

TEST(Socket, TryBindOnBusyPortFails) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(false, true, port);

  Socket second(Socket::Type::Stream);
  EXPECT_FALSE(second.tryBind(false, true, port));
}

}  // namespace splicenet
