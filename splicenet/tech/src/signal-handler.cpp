#include "splicenet/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void SplicenetSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace splicenet {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::SplicenetSignalHandler);
  std::signal(SIGTERM, ::SplicenetSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() noexcept { return g_signalStatus != 0; }

int SignalHandler::StopSignal() noexcept { return g_signalStatus; }

void SignalHandler::ResetStopRequest() noexcept { g_signalStatus = 0; }

}  // namespace splicenet
