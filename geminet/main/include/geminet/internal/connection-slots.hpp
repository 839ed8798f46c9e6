#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace geminet::internal {

// Fixed capacity table of threads serving connections.
// Only the accept loop thread may call acquire(), launch() and joinAll(). Units release their slot themselves.
class ConnectionSlots {
 public:
  using SlotIdx = uint32_t;

  explicit ConnectionSlots(uint32_t capacity);

  ConnectionSlots(const ConnectionSlots&) = delete;
  ConnectionSlots(ConnectionSlots&&) noexcept = delete;
  ConnectionSlots& operator=(const ConnectionSlots&) = delete;
  ConnectionSlots& operator=(ConnectionSlots&&) noexcept = delete;

  // Joins all running units.
  ~ConnectionSlots();

  // Reserves a free slot, waiting at most timeout for one to be released.
  [[nodiscard]] std::optional<SlotIdx> acquire(std::chrono::milliseconds timeout);

  // Gives back a reserved slot that will not be launched.
  void release(SlotIdx slot);

  // Runs unit in a new thread owning the previously acquired slot. The slot is released when unit returns.
  // unit must not throw. Throws std::system_error if the thread cannot be created, the slot being released.
  void launch(SlotIdx slot, std::move_only_function<void()> unit);

  // Waits for the completion of every launched unit.
  void joinAll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_threads.size()); }

  // Number of launched units not finished yet. Reserved slots not yet launched are not counted.
  [[nodiscard]] uint32_t nbActive() const noexcept { return _nbActive.load(); }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::vector<SlotIdx> _freeSlots;
  std::vector<std::jthread> _threads;
  std::atomic<uint32_t> _nbActive{0};
};

}  // namespace geminet::internal
