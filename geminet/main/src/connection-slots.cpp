#include "geminet/internal/connection-slots.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace geminet::internal {

ConnectionSlots::ConnectionSlots(uint32_t capacity) : _threads(capacity) {
  _freeSlots.reserve(capacity);
  // Lowest indices are handed out first.
  for (SlotIdx slot = capacity; slot > 0; --slot) {
    _freeSlots.push_back(slot - 1U);
  }
}

ConnectionSlots::~ConnectionSlots() { joinAll(); }

std::optional<ConnectionSlots::SlotIdx> ConnectionSlots::acquire(std::chrono::milliseconds timeout) {
  std::unique_lock lock(_mutex);
  if (!_cv.wait_for(lock, timeout, [this] { return !_freeSlots.empty(); })) {
    return std::nullopt;
  }
  const SlotIdx slot = _freeSlots.back();
  _freeSlots.pop_back();
  return slot;
}

void ConnectionSlots::release(SlotIdx slot) {
  {
    std::scoped_lock lock(_mutex);
    _freeSlots.push_back(slot);
  }
  _cv.notify_one();
}

void ConnectionSlots::launch(SlotIdx slot, std::move_only_function<void()> unit) {
  auto& thread = _threads[slot];
  // The previous owner of this slot released it: its thread is finished or about to be.
  if (thread.joinable()) {
    thread.join();
  }
  ++_nbActive;
  try {
    thread = std::jthread([this, slot, unit = std::move(unit)]() mutable {
      unit();
      --_nbActive;
      release(slot);
    });
  } catch (const std::system_error&) {
    --_nbActive;
    release(slot);
    throw;
  }
}

void ConnectionSlots::joinAll() {
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace geminet::internal
