#include "splicenet/op-error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "splicenet/connection.hpp"
#include "splicenet/test-util.hpp"

namespace splicenet {

TEST(OpError, MessageContainsAllParts) {
  const OpError err("splice", "tcp", "127.0.0.1:9000", std::error_code(EPIPE, std::generic_category()));
  EXPECT_EQ(err.op(), "splice");
  EXPECT_EQ(err.net(), "tcp");
  EXPECT_EQ(err.addr(), "127.0.0.1:9000");
  EXPECT_EQ(err.cause(), std::error_code(EPIPE, std::generic_category()));
  EXPECT_EQ(err.message(), "splice tcp 127.0.0.1:9000: " + std::generic_category().message(EPIPE));
}

TEST(OpError, EmptyContextIsSkipped) {
  const OpError err("pipe", "", "", std::error_code(EMFILE, std::generic_category()));
  EXPECT_EQ(err.message(), "pipe: " + std::generic_category().message(EMFILE));
}

TEST(OpError, ContextFromConnection) {
  auto pair = test::MakeTcpPair();
  const OpError err("lock", pair.client, std::make_error_code(std::errc::operation_canceled));
  EXPECT_EQ(err.net(), "tcp");
  EXPECT_EQ(err.addr(), pair.client.remoteAddress());
}

TEST(OpError, Equality) {
  const std::error_code cause(EPIPE, std::generic_category());
  EXPECT_EQ(OpError("splice", "tcp", "a", cause), OpError("splice", "tcp", "a", cause));
  EXPECT_NE(OpError("splice", "tcp", "a", cause), OpError("wait", "tcp", "a", cause));
}

}  // namespace splicenet
