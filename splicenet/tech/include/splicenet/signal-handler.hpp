#pragma once

namespace splicenet {

// Process-wide stop request driven by SIGINT / SIGTERM.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Install handlers for SIGINT and SIGTERM that record a stop request.
  static void Enable();

  // Restore the default behavior of SIGINT and SIGTERM.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested() noexcept;

  // Returns the number of the last termination signal received, 0 if none.
  static int StopSignal() noexcept;

  // Clears the stop request, allowing multiple runs in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace splicenet
