#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace geminet {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 address literal to bind. Default: all interfaces.
  std::string bindAddress{"0.0.0.0"};
  // TCP port to bind. 0 lets the OS pick an ephemeral free port, retrievable with GeminiServer::port() once running.
  // Default: 1965, the Gemini port.
  uint16_t port{1965};
  // If true, sets SO_REUSEADDR on the listening socket so that a restarted server can bind a port whose
  // previous connections are still in TIME_WAIT. Disabled by default.
  bool reuseAddress{false};

  // ===========================================
  // Concurrency & connection lifecycle controls
  // ===========================================
  // Maximum number of connections served concurrently, each by its own thread. Also used as listen backlog.
  // When all slots are busy, new clients wait in the kernel backlog. Default: 128.
  uint32_t maxConnections{128};
  // Upper bound of the time needed by the accept loop to observe a shutdown request. Default: 100 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};
  // Maximum duration of a single receive while reading the request line. A value of 0 disables it: a peer that
  // never completes its request then holds a connection slot until it disconnects. Default: disabled.
  std::chrono::milliseconds requestReadTimeout{std::chrono::milliseconds{0}};
  // Maximum duration of a single send while writing the response. 0 disables it. Default: disabled.
  std::chrono::milliseconds writeTimeout{std::chrono::milliseconds{0}};

  // Fluent builder style setters
  ServerConfig& withBindAddress(std::string bindAddress);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReuseAddress(bool on = true);

  ServerConfig& withMaxConnections(uint32_t maxConnections);

  ServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  ServerConfig& withRequestReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withWriteTimeout(std::chrono::milliseconds timeout);

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace geminet
