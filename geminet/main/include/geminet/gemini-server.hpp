#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string_view>

#include "geminet/connection.hpp"
#include "geminet/gemini-request.hpp"
#include "geminet/gemini-response.hpp"
#include "geminet/internal/lifecycle.hpp"
#include "geminet/server-config.hpp"

namespace geminet {

namespace internal {
class ConnectionSlots;
}

// Gemini server bound to one listening socket.
//
// run() blocks the calling thread: it accepts connections and serves each of them in its own thread, calling the
// handler once per request. The handler fills the response and either sends it itself (GeminiResponse::flush or
// GeminiResponse::writeHeader) or returns and lets the server send it:
//   * a success status is sent with the body and the text/gemini content type,
//   * any other status is sent with a default META.
// A handler that throws makes the server answer "40 Unexpected error. Retry later." if nothing was sent yet.
//
// shutdown() may be called from any thread (including from a handler). It stops accepting new connections;
// run() then waits for the connections being served and returns. A stopped server can be run again.
class GeminiServer {
 public:
  // Called concurrently from the threads serving connections.
  using Handler = std::function<void(GeminiResponse&, const GeminiRequest&)>;

  GeminiServer() noexcept = default;

  GeminiServer(const GeminiServer&) = delete;
  GeminiServer(GeminiServer&&) noexcept = delete;
  GeminiServer& operator=(const GeminiServer&) = delete;
  GeminiServer& operator=(GeminiServer&&) noexcept = delete;

  ~GeminiServer() = default;

  // Serves until shutdown() is called or, when SignalHandler is enabled, a termination signal is received.
  // Throws std::invalid_argument for an invalid config or an empty handler, std::logic_error if already running,
  // std::system_error if the listening socket cannot be set up or on an unrecoverable accept failure.
  void run(ServerConfig config, Handler handler);

  // Requests the server to stop. Thread safe, idempotent, no-op if the server is not running.
  void shutdown() noexcept;

  // Bound port while the server is listening, 0 otherwise.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(); }

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  // Number of connections currently being served.
  [[nodiscard]] uint32_t nbActiveConnections() const noexcept { return _nbActiveConnections.load(); }

 private:
  void acceptLoop(const Socket& listenSocket, internal::ConnectionSlots& slots, const Handler& handler);

  void serveConnection(Connection cnx, const Handler& handler) const;

  ServerConfig _config;
  internal::Lifecycle _lifecycle;
  std::atomic<uint16_t> _port{0};
  std::atomic<uint32_t> _nbActiveConnections{0};
};

// Runs a GeminiServer with default options, SO_REUSEADDR enabled, until a shutdown signal is received.
// SignalHandler is enabled for the duration of the call.
void ListenAndServe(std::string_view bindAddress, uint16_t port, GeminiServer::Handler handler);

}  // namespace geminet
