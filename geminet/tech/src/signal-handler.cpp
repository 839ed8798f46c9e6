#include "geminet/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe work here: the accept loop logs when it observes the flag.
extern "C" void GeminetSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace geminet {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::GeminetSignalHandler);
  std::signal(SIGTERM, ::GeminetSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace geminet
