#include "geminet/gemini-server.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "geminet/connection.hpp"
#include "geminet/errno-throw.hpp"
#include "geminet/gemini-constants.hpp"
#include "geminet/gemini-request.hpp"
#include "geminet/gemini-response.hpp"
#include "geminet/gemini-status-code.hpp"
#include "geminet/internal/connection-slots.hpp"
#include "geminet/log.hpp"
#include "geminet/server-config.hpp"
#include "geminet/signal-handler.hpp"
#include "geminet/socket.hpp"
#include "geminet/transport.hpp"

namespace geminet {

namespace {

// Time granted to a client to read the response and close its side before the server closes the connection.
constexpr std::chrono::milliseconds kLingerTimeout{1000};
constexpr std::size_t kMaxLingerBytes = 1U << 16;

// Accept failures caused by a single client or by a temporary lack of resources: the server keeps accepting.
bool IsTransientAcceptError(int errnum) noexcept {
  switch (errnum) {
    case ECONNABORTED:
    case ECONNRESET:
    case EPROTO:
    case EINTR:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
      return true;
    default:
      return false;
  }
}

// Answers with a temporary failure if the client did not receive anything yet.
// Raw bytes the handler left pending in the low level writer are dropped in favor of the error header.
void SendUnexpectedError(GeminiResponse& response) {
  auto& writer = response.bufferedWriter();
  if (response.isFlushed() || writer.hasSentBytes()) {
    return;
  }
  writer.discard();
  response.writeHeader(gemini::StatusCodeTemporaryFailure, gemini::kUnexpectedErrorMeta);
}

// Sends the response the handler left unsent.
void AutoFlush(GeminiResponse& response) {
  if (response.bufferedWriter().pendingBytes() != 0) {
    // handler wrote its own response through the low level writer
    response.bufferedWriter().flush();
    return;
  }
  const auto status = response.status();
  if (gemini::IsSuccess(status)) {
    response.flush();
  } else {
    response.writeHeader(status, gemini::DefaultMeta(status));
  }
}

// Returns true if a response was sent.
bool HandleParseFailure(const RequestParseResult& res, GeminiResponse& response, int fd) {
  if (IsPeerGone(res.status)) {
    log::debug("Closing fd # {} without response: {}", fd, RequestParseStatusToStr(res.status));
    return false;
  }
  if (IsMalformedRequest(res.status)) {
    log::debug("Malformed request on fd # {}: {}", fd, RequestParseStatusToStr(res.status));
    response.writeHeader(gemini::StatusCodeBadRequest, gemini::kMalformedRequestMeta);
    return true;
  }
  if (res.status == RequestParseStatus::BufferTooSmall) {
    log::error("Internal error: request buffer too small for fd # {}", fd);
    return false;
  }
  log::error("Read error on fd # {}: {}", fd, std::strerror(res.sysErrno));
  response.writeHeader(gemini::StatusCodeTemporaryFailure, gemini::kUnexpectedErrorMeta);
  return true;
}

}  // namespace

void GeminiServer::run(ServerConfig config, Handler handler) {
  if (!handler) {
    throw std::invalid_argument("Gemini server requires a handler");
  }
  config.validate();
  if (!_lifecycle.tryEnterRunning()) {
    throw std::logic_error("Gemini server is already running");
  }

  try {
    _config = std::move(config);

    Socket listenSocket(Socket::Type::Stream);
    uint16_t port = _config.port;
    listenSocket.bindAndListen(_config.bindAddress, _config.reuseAddress, port,
                               static_cast<int>(_config.maxConnections));
    _port.store(port);
    log::info("Gemini server listening on {}:{}", _config.bindAddress, port);

    // Destroyed before the listening socket: joins the units still running if the accept loop throws.
    internal::ConnectionSlots slots(_config.maxConnections);
    acceptLoop(listenSocket, slots, handler);

    _port.store(0);
    listenSocket.close();
    log::info("Initiating graceful drain (connections={})", slots.nbActive());
    slots.joinAll();
    log::info("Gemini server stopped");
  } catch (const std::exception& ex) {
    log::error("Gemini server failure: {}", ex.what());
    _port.store(0);
    _lifecycle.reset();
    throw;
  }
  _lifecycle.reset();
}

void GeminiServer::shutdown() noexcept {
  if (_lifecycle.tryEnterDraining()) {
    log::debug("Shutdown requested");
  }
}

void GeminiServer::acceptLoop(const Socket& listenSocket, internal::ConnectionSlots& slots, const Handler& handler) {
  while (true) {
    if (SignalHandler::IsStopRequested() && _lifecycle.tryEnterDraining()) {
      log::warn("Termination signal received, stopping");
    }
    if (!_lifecycle.isRunning()) {
      break;
    }

    // All slots busy: new clients wait in the listen backlog.
    const auto slot = slots.acquire(_config.pollInterval);
    if (!slot) {
      continue;
    }
    if (!listenSocket.waitReadable(_config.pollInterval) || !_lifecycle.isRunning()) {
      slots.release(*slot);
      continue;
    }

    Connection cnx(listenSocket);
    if (!cnx) {
      slots.release(*slot);
      const int err = cnx.acceptError();
      if (IsTransientAcceptError(err)) {
        log::warn("Transient accept failure: {}", std::strerror(err));
        continue;
      }
      throw_system_error(err, "accept failed on listening fd # {}", listenSocket.fd());
    }

    ++_nbActiveConnections;
    try {
      slots.launch(*slot, [this, cnx = std::move(cnx), &handler]() mutable {
        serveConnection(std::move(cnx), handler);
        --_nbActiveConnections;
      });
    } catch (const std::system_error& ex) {
      --_nbActiveConnections;
      log::error("Unable to start a thread for a new connection: {}", ex.what());
    }
  }
}

void GeminiServer::serveConnection(Connection cnx, const Handler& handler) const {
  const int fd = cnx.fd();
  if (_config.requestReadTimeout.count() > 0 && !cnx.setReceiveTimeout(_config.requestReadTimeout)) {
    log::warn("Unable to set receive timeout on fd # {}: {}", fd, std::strerror(errno));
  }
  if (_config.writeTimeout.count() > 0 && !cnx.setSendTimeout(_config.writeTimeout)) {
    log::warn("Unable to set send timeout on fd # {}: {}", fd, std::strerror(errno));
  }

  PlainTransport transport(fd);
  GeminiResponse response(transport);
  std::array<char, gemini::kMaxRequestLineSize> buffer;
  bool responseSent = false;

  try {
    const RequestParseResult res = ParseRequest(transport, buffer);
    if (!res.ok()) {
      responseSent = HandleParseFailure(res, response, fd);
    } else {
      const GeminiRequest& request = res.request;
      log::debug("Request on fd # {}: host={} path=/{}", fd, request.host(), request.path().value_or(""));
      bool handlerFailed = false;
      try {
        handler(response, request);
      } catch (const std::exception& ex) {
        log::error("Exception in request handler: {}", ex.what());
        handlerFailed = true;
      } catch (...) {
        log::error("Unknown exception in request handler");
        handlerFailed = true;
      }
      if (handlerFailed) {
        SendUnexpectedError(response);
      } else if (!response.isFlushed()) {
        AutoFlush(response);
      }
      responseSent = true;
    }
  } catch (const std::system_error& ex) {
    log::debug("Write failure on fd # {}: {}", fd, ex.what());
    responseSent = false;
  } catch (const std::exception& ex) {
    log::error("Error while serving fd # {}: {}", fd, ex.what());
  }

  if (responseSent && cnx.shutdownWrite()) {
    cnx.discardInput(kLingerTimeout, kMaxLingerBytes);
  }
  log::debug("Closing connection fd # {}", fd);
}

void ListenAndServe(std::string_view bindAddress, uint16_t port, GeminiServer::Handler handler) {
  ServerConfig config;
  config.withBindAddress(std::string(bindAddress)).withPort(port).withReuseAddress();

  GeminiServer server;
  SignalHandler::Enable();
  try {
    server.run(std::move(config), std::move(handler));
  } catch (const std::exception&) {
    SignalHandler::Disable();
    throw;
  }
  SignalHandler::Disable();
}

}  // namespace geminet
