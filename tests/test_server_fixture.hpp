#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "geminet/gemini-server.hpp"
#include "geminet/server-config.hpp"

// RAII test server harness:
//  * runs GeminiServer::run in a background jthread on an ephemeral loopback port,
//  * waits until the server listens before returning from the constructor,
//  * shuts down and joins on destruction (idempotent).
struct TestServer {
  explicit TestServer(geminet::GeminiServer::Handler handler, geminet::ServerConfig cfg = DefaultConfig())
      : loopThread([this, cfg = std::move(cfg), handler = std::move(handler)]() mutable {
          try {
            server.run(std::move(cfg), std::move(handler));
          } catch (const std::exception&) {
            runError = std::current_exception();
          }
        }) {
    waitReady(std::chrono::milliseconds{2000});
  }

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  static geminet::ServerConfig DefaultConfig() {
    geminet::ServerConfig cfg;
    cfg.withBindAddress("127.0.0.1").withPort(0).withPollInterval(std::chrono::milliseconds{20});
    return cfg;
  }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Requests shutdown and waits for run() to return.
  void stop() {
    server.shutdown();
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  geminet::GeminiServer server;
  std::exception_ptr runError;

 private:
  void waitReady(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (server.port() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    if (server.port() == 0) {
      stop();
      throw std::runtime_error("Gemini test server did not start listening in time");
    }
  }

  std::jthread loopThread;
};
