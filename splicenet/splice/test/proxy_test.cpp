#include "splicenet/proxy.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "splicenet/socket-ops.hpp"
#include "splicenet/splice-engine.hpp"
#include "splicenet/test-util.hpp"

namespace splicenet {

using namespace std::chrono_literals;

// client <-> [downstream.server | proxy | upstream.client] <-> server
class ProxyTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { IgnoreSigPipe(); }

  void startProxy() {
    proxyThread = std::jthread(
        [this] { result = Proxy(std::move(downstream.server), std::move(upstream.client), engine); });
  }

  SpliceEngine engine;
  test::ConnectionPair downstream = test::MakeTcpPair();
  test::ConnectionPair upstream = test::MakeTcpPair();
  ProxyResult result;
  std::jthread proxyThread;
};

TEST_F(ProxyTest, RequestResponse) {
  startProxy();
  Connection& client = downstream.client;
  Connection& server = upstream.server;

  const std::string request = test::MakePayload(3UL * 1024 * 1024, 11);
  const std::string response = test::MakePayload(1024UL * 1024, 12);

  std::string clientReceived;
  std::jthread clientThread([&] {
    EXPECT_FALSE(client.writeAll(request).ec);
    EXPECT_TRUE(client.shutdownWrite());
    clientReceived = test::ReadUntilEof(client);
  });

  EXPECT_EQ(test::ReadUntilEof(server), request);
  EXPECT_FALSE(server.writeAll(response).ec);
  EXPECT_TRUE(server.shutdownWrite());

  clientThread.join();
  proxyThread.join();
  EXPECT_EQ(clientReceived, response);
  EXPECT_TRUE(result.forward.ok());
  EXPECT_TRUE(result.backward.ok());
  EXPECT_EQ(result.forward.written, static_cast<int64_t>(request.size()));
  EXPECT_EQ(result.backward.written, static_cast<int64_t>(response.size()));
}

TEST_F(ProxyTest, HalfClosePropagatesWithoutResponse) {
  startProxy();
  Connection& client = downstream.client;
  Connection& server = upstream.server;

  ASSERT_FALSE(client.writeAll(std::string_view("hello upstream")).ec);
  ASSERT_TRUE(client.shutdownWrite());

  // The server sees a clean EOF after the request, while its own write side is still open.
  EXPECT_EQ(test::ReadUntilEof(server), "hello upstream");
  server.close();

  EXPECT_EQ(test::ReadUntilEof(client), "");
  proxyThread.join();
  EXPECT_EQ(result.forward.written, 14);
  EXPECT_EQ(result.backward.written, 0);
}

TEST_F(ProxyTest, ServerSpeaksFirst) {
  startProxy();
  Connection& client = downstream.client;
  Connection& server = upstream.server;

  ASSERT_FALSE(server.writeAll(std::string_view("220 ready")).ec);
  ASSERT_TRUE(server.shutdownWrite());
  EXPECT_EQ(test::ReadUntilEof(client), "220 ready");

  ASSERT_FALSE(client.writeAll(std::string_view("QUIT")).ec);
  ASSERT_TRUE(client.shutdownWrite());
  EXPECT_EQ(test::ReadUntilEof(server), "QUIT");

  proxyThread.join();
  EXPECT_TRUE(result.forward.ok());
  EXPECT_TRUE(result.backward.ok());
}

TEST_F(ProxyTest, CancellingIdleConnectionsStopsBothDirections) {
  ProxyResult res;
  std::jthread relay([&] { res = ProxyConnections(downstream.server, upstream.client, engine); });
  std::this_thread::sleep_for(50ms);

  // Each direction holds the write token of one connection while waiting on the other one.
  downstream.server.cancel();
  upstream.client.cancel();
  relay.join();

  const auto canceled = std::make_error_code(std::errc::operation_canceled);
  ASSERT_TRUE(res.forward.error.has_value());
  EXPECT_EQ(res.forward.error->cause(), canceled);
  ASSERT_TRUE(res.backward.error.has_value());
  EXPECT_EQ(res.backward.error->cause(), canceled);
  EXPECT_EQ(res.forward.written, 0);
  EXPECT_EQ(res.backward.written, 0);
  EXPECT_FALSE(downstream.server);
  EXPECT_FALSE(upstream.client);

  // Both peers observe the shutdown.
  EXPECT_EQ(test::ReadUntilEof(downstream.client), "");
  EXPECT_EQ(test::ReadUntilEof(upstream.server), "");
}

}  // namespace splicenet
