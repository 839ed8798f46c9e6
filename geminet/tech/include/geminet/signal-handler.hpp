#pragma once

namespace geminet {

// Process-wide SIGINT / SIGTERM hook. A running GeminiServer polls IsStopRequested() between accepts
// and starts draining when it turns true.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  static void Enable();

  // Restores the default dispositions. The stop flag is left untouched.
  static void Disable();

  static bool IsStopRequested();

 private:
  friend class SignalHandlerTest;

  static void ResetStopRequest();
};

}  // namespace geminet
