// TCP proxy relaying each accepted client to an upstream server with zero-copy splice.
//
// Usage: splicenet-proxy --upstream-port <port> [--port <port>] [--upstream-host <host>]
//                        [--chunk-bytes <n>] [--pipe-bytes <n>] [--connect-timeout-ms <n>] [--log-level <level>]
#include <poll.h>

#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "splicenet/splicenet.hpp"
#include "splicenet/signal-handler.hpp"

namespace {

using namespace splicenet;

struct ProxyConfig {
  void validate() const {
    if (upstreamPort == 0) {
      throw std::invalid_argument("--upstream-port is required");
    }
    if (upstreamHost.empty()) {
      throw std::invalid_argument("--upstream-host should not be empty");
    }
    splice.validate();
  }

  uint16_t port{8080};
  std::string upstreamHost{"127.0.0.1"};
  uint16_t upstreamPort{0};
  std::chrono::milliseconds connectTimeout{1000};
  SpliceConfig splice;
  log::level::level_enum logLevel{log::level::info};
};

template <typename T>
T ParseNumber(std::string_view flag, std::string_view value) {
  T ret{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::invalid_argument(std::format("Invalid value '{}' for {}", value, flag));
  }
  return ret;
}

ProxyConfig ParseArgs(int argc, char** argv) {
  ProxyConfig config;
  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view flag(argv[argPos]);
    if (flag == "--help" || flag == "-h") {
      std::cout << "Usage: " << argv[0]
                << " --upstream-port <port> [--port <port>] [--upstream-host <host>] [--chunk-bytes <n>]"
                   " [--pipe-bytes <n>] [--connect-timeout-ms <n>] [--log-level <level>]\n";
      std::exit(0);
    }
    if (argPos + 1 == argc) {
      throw std::invalid_argument(std::format("Missing value for {}", flag));
    }
    const std::string_view value(argv[++argPos]);
    if (flag == "--port") {
      config.port = ParseNumber<uint16_t>(flag, value);
    } else if (flag == "--upstream-host") {
      config.upstreamHost = value;
    } else if (flag == "--upstream-port") {
      config.upstreamPort = ParseNumber<uint16_t>(flag, value);
    } else if (flag == "--chunk-bytes") {
      config.splice.withMaxChunkBytes(ParseNumber<std::size_t>(flag, value));
    } else if (flag == "--pipe-bytes") {
      config.splice.withPipeCapacityBytes(ParseNumber<std::size_t>(flag, value));
    } else if (flag == "--connect-timeout-ms") {
      config.connectTimeout = std::chrono::milliseconds{ParseNumber<uint32_t>(flag, value)};
    } else if (flag == "--log-level") {
      config.logLevel = log::level::from_str(std::string(value));
    } else {
      throw std::invalid_argument(std::format("Unknown option {}", flag));
    }
  }
  return config;
}

// One accepted client. The accept loop keeps it alive until its worker finished, so that it can cancel both
// connections on shutdown.
struct Session {
  explicit Session(Connection&& cnx) : client(std::move(cnx)) {}

  void cancel() {
    std::scoped_lock<std::mutex> lock(mutex);
    cancelled = true;
    client.cancel();
    upstream.cancel();
  }

  std::mutex mutex;
  bool cancelled{false};
  Connection client;
  Connection upstream;
  std::atomic<bool> done{false};
  std::jthread worker;  // last: joined before the connections are destroyed
};

void Serve(Session& session, const ProxyConfig& config, const SpliceEngine& engine) {
  const std::string peer(session.client.remoteAddress());
  try {
    Connection upstream = DialTCP(config.upstreamHost, config.upstreamPort, config.connectTimeout);
    std::scoped_lock<std::mutex> lock(session.mutex);
    if (!session.cancelled) {
      session.upstream = std::move(upstream);
    }
  } catch (const std::system_error& ex) {
    log::error("Client {}: {}", peer, ex.what());
    session.done.store(true, std::memory_order_release);
    return;
  }
  if (session.upstream) {
    const auto res = ProxyConnections(session.client, session.upstream, engine);
    log::info("Client {} done: {} bytes up, {} bytes down", peer, res.forward.written, res.backward.written);
  }
  session.done.store(true, std::memory_order_release);
}

}  // namespace

int main(int argc, char** argv) {
  ProxyConfig config;
  std::unique_ptr<const SpliceEngine> engine;
  try {
    config = ParseArgs(argc, argv);
    config.validate();
    log::set_level(config.logLevel);
    engine = std::make_unique<const SpliceEngine>(config.splice);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  IgnoreSigPipe();
  SignalHandler::Enable();

  Socket listener;
  uint16_t port = config.port;
  try {
    listener = Socket(Socket::Type::StreamNonBlock);
    listener.bindAndListen(false, false, port);
  } catch (const std::system_error& ex) {
    log::critical("Unable to listen on port {}: {}", port, ex.what());
    return 1;
  }
  log::info("Proxying port {} to {}:{} (chunk {} bytes)", port, config.upstreamHost, config.upstreamPort,
            engine->config().maxChunkBytes);

  static constexpr int kPollTimeoutMs = 500;
  std::vector<std::unique_ptr<Session>> sessions;
  while (!SignalHandler::IsStopRequested()) {
    std::erase_if(sessions, [](const auto& session) { return session->done.load(std::memory_order_acquire); });

    pollfd pfd{listener.fd(), POLLIN, 0};
    const int ret = ::poll(&pfd, 1, kPollTimeoutMs);
    if (ret == -1 && errno != EINTR) {
      log::error("poll on listener failed: {}", SystemErrorMessage(errno));
      break;
    }
    if (ret <= 0) {
      continue;
    }
    Connection client(listener);
    if (!client) {
      continue;
    }
    log::debug("Accepted client {}", client.remoteAddress());
    auto& session = sessions.emplace_back(std::make_unique<Session>(std::move(client)));
    session->worker = std::jthread(Serve, std::ref(*session), std::cref(config), std::cref(*engine));
  }

  log::info("Stopping after signal {}, cancelling {} session(s)", SignalHandler::StopSignal(), sessions.size());
  for (auto& session : sessions) {
    session->cancel();
  }
  sessions.clear();
  return 0;
}
