#pragma once

#include <atomic>
#include <cstdint>

namespace geminet::internal {

// Lifecycle of a GeminiServer: Idle -> Running -> Draining -> Idle.
// The state doubles as the shutdown flag: leaving Running is how a stop is requested. It is read and written
// from several threads, with sequentially consistent ordering.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining };

  // Atomically moves from Idle to Running. Returns false if the server was not Idle.
  bool tryEnterRunning() noexcept {
    State expected = State::Idle;
    return state.compare_exchange_strong(expected, State::Running);
  }

  // Atomically moves from Running to Draining. Returns false if the server was not Running,
  // which makes stop requests idempotent and no-ops on an idle server.
  bool tryEnterDraining() noexcept {
    State expected = State::Running;
    return state.compare_exchange_strong(expected, State::Draining);
  }

  void reset() noexcept { state.store(State::Idle); }

  [[nodiscard]] bool isIdle() const noexcept { return state.load() == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load() == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load() == State::Draining; }
  [[nodiscard]] bool isActive() const noexcept { return state.load() != State::Idle; }

  std::atomic<State> state{State::Idle};
};

}  // namespace geminet::internal
