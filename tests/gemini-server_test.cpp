#include "geminet/gemini-server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "geminet/gemini-constants.hpp"
#include "geminet/gemini-request.hpp"
#include "geminet/gemini-response.hpp"
#include "geminet/gemini-status-code.hpp"
#include "geminet/mime-type.hpp"
#include "geminet/server-config.hpp"
#include "geminet/socket.hpp"
#include "geminet/test_util.hpp"
#include "test_server_fixture.hpp"

using namespace std::chrono_literals;
using namespace geminet;

namespace {

void HelloHandler(GeminiResponse& resp, [[maybe_unused]] const GeminiRequest& req) {
  resp.appendBody("Hello, world!");
  resp.flush();
}

std::string Request(uint16_t port, std::string_view uri) { return test::sendAndCollect(port, std::string(uri) + "\r\n"); }

}  // namespace

TEST(GeminiServer, FullTransaction) {
  TestServer ts(HelloHandler);
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\nHello, world!");
}

TEST(GeminiServer, RequestComponentsReachHandler) {
  std::mutex mutex;
  std::vector<std::string> seen;
  TestServer ts([&](GeminiResponse& resp, const GeminiRequest& req) {
    {
      std::scoped_lock lock(mutex);
      seen.emplace_back(req.host());
      seen.emplace_back(req.path().value_or("<none>"));
      seen.emplace_back(req.query().value_or("<none>"));
    }
    resp.appendBody(req.path().value_or(""));
  });
  auto parsed = test::parseResponse(Request(ts.port(), "gemini://example.org:1965/docs/a.gmi?search"));
  ASSERT_TRUE(parsed.wellFramed);
  EXPECT_EQ(parsed.status, 20);
  EXPECT_EQ(parsed.body, "docs/a.gmi");

  std::scoped_lock lock(mutex);
  EXPECT_EQ(seen, (std::vector<std::string>{"example.org", "docs/a.gmi", "search"}));
}

TEST(GeminiServer, AutoFlushUsesDefaultMimeType) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) { resp.appendBody("# Title\n"); });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\n# Title\n");
}

TEST(GeminiServer, AutoFlushEmptyBody) {
  TestServer ts([](GeminiResponse&, const GeminiRequest&) {});
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\n");
}

TEST(GeminiServer, FlushWithExplicitMimeType) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest& req) {
    resp.appendBody("plain");
    resp.flush(MimeType::FromFileName(req.path().value_or("")));
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/notes.txt"), "20 text/plain\r\nplain");
}

TEST(GeminiServer, NonSuccessStatusWithoutWriteGetsDefaultMeta) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) { resp.status(gemini::StatusCodeNotFound); });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/missing"), "51 Not found\r\n");
}

TEST(GeminiServer, WriteHeaderFromHandler) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) {
    resp.writeHeader(gemini::StatusCodeRedirectPermanent, "gemini://localhost/new");
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/old"), "31 gemini://localhost/new\r\n");
}

TEST(GeminiServer, LargeBody) {
  const std::string body(200000, 'b');
  TestServer ts([&body](GeminiResponse& resp, const GeminiRequest&) { resp.appendBody(body); });
  auto parsed = test::parseResponse(Request(ts.port(), "gemini://localhost/big"));
  ASSERT_TRUE(parsed.wellFramed);
  EXPECT_EQ(parsed.status, 20);
  EXPECT_EQ(parsed.body, body);
}

TEST(GeminiServer, MalformedRequestsGetBadRequest) {
  std::atomic<int> nbHandlerCalls{0};
  TestServer ts([&](GeminiResponse&, const GeminiRequest&) { ++nbHandlerCalls; });
  std::string tooLong = "gemini://localhost/";
  tooLong.append(gemini::kMaxUriSize, 'a');
  for (std::string_view raw : {std::string_view("\r\n"), std::string_view("example.com\r\n"),
                               std::string_view("gemini://exa|mple\r\n"), std::string_view("gemini://localhost\n"),
                               std::string_view("gemini://[::1\r\n"), std::string_view("gemini://host:99999\r\n")}) {
    EXPECT_EQ(test::sendAndCollect(ts.port(), raw), "59 Malformed request\r\n") << raw;
  }
  EXPECT_EQ(Request(ts.port(), tooLong), "59 Malformed request\r\n");
  EXPECT_EQ(nbHandlerCalls.load(), 0);
}

TEST(GeminiServer, RequestWithoutLineEndingBeforeClose) {
  TestServer ts(HelloHandler);
  test::ClientConnection client(ts.port());
  test::sendAll(client.fd(), "gemini://localhost/");
  client.shutdownWrite();
  EXPECT_EQ(test::recvUntilClosed(client.fd()), "59 Malformed request\r\n");
}

TEST(GeminiServer, SilentCloseWhenClientSendsNothing) {
  TestServer ts(HelloHandler);
  {
    test::ClientConnection client(ts.port());
    client.shutdownWrite();
    EXPECT_EQ(test::recvUntilClosed(client.fd()), "");
  }
  // still serving
  EXPECT_EQ(test::parseResponse(Request(ts.port(), "gemini://localhost/")).status, 20);
}

TEST(GeminiServer, HandlerExceptionGivesTemporaryFailure) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest& req) {
    resp.appendBody("partial");
    if (req.path() == "boom") {
      throw std::runtime_error("handler failure");
    }
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/boom"), "40 Unexpected error. Retry later.\r\n");
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/fine"), "20 text/gemini; charset=UTF-8\r\npartial");
}

TEST(GeminiServer, NonStandardExceptionGivesTemporaryFailure) {
  TestServer ts([](GeminiResponse&, const GeminiRequest&) { throw 42; });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "40 Unexpected error. Retry later.\r\n");
}

TEST(GeminiServer, HandlerExceptionAfterFlushKeepsFlushedResponse) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) {
    resp.appendBody("done");
    resp.flush();
    throw std::runtime_error("late failure");
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\ndone");
}

TEST(GeminiServer, HandlerExceptionDropsPendingRawBytes) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) {
    resp.bufferedWriter().write("20 text/plain\r\npart");
    throw std::runtime_error("handler failure");
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "40 Unexpected error. Retry later.\r\n");
}

TEST(GeminiServer, FlushAfterRawBytesGivesTemporaryFailure) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) {
    resp.bufferedWriter().write("20 text/plain\r\n");
    resp.flush();
  });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "40 Unexpected error. Retry later.\r\n");
}

TEST(GeminiServer, SlowDownWithoutWriteGetsRetryDelay) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) { resp.status(gemini::StatusCodeSlowDown); });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "44 1\r\n");
}

TEST(GeminiServer, ResponseMisuseInHandlerGivesTemporaryFailure) {
  TestServer ts([](GeminiResponse& resp, const GeminiRequest&) { resp.writeHeader(gemini::StatusCodeSuccess, ""); });
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "40 Unexpected error. Retry later.\r\n");
}

TEST(GeminiServer, ConcurrentClientsAreDrainedOnShutdown) {
  static constexpr int kNbClients = 5;
  std::latch entered(kNbClients);
  std::latch release(1);
  TestServer ts([&](GeminiResponse& resp, const GeminiRequest& req) {
    entered.count_down();
    release.wait();
    resp.appendBody(req.path().value_or(""));
  });

  std::vector<std::string> responses(kNbClients);
  std::vector<std::jthread> clients;
  for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
    clients.emplace_back([&, clientPos, port = ts.port()] {
      responses[static_cast<std::size_t>(clientPos)] =
          Request(port, "gemini://localhost/client" + std::to_string(clientPos));
    });
  }
  entered.wait();
  EXPECT_EQ(ts.server.nbActiveConnections(), static_cast<uint32_t>(kNbClients));

  ts.server.shutdown();
  EXPECT_FALSE(ts.server.isRunning());
  release.count_down();
  ts.stop();
  clients.clear();

  for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
    EXPECT_EQ(responses[static_cast<std::size_t>(clientPos)],
              "20 text/gemini; charset=UTF-8\r\nclient" + std::to_string(clientPos));
  }
  EXPECT_EQ(ts.server.nbActiveConnections(), 0U);
  EXPECT_EQ(ts.server.port(), 0);
}

TEST(GeminiServer, ConcurrencyBoundedByMaxConnections) {
  static constexpr int kNbClients = 4;
  std::atomic<int> current{0};
  std::atomic<int> maxObserved{0};
  TestServer ts(
      [&](GeminiResponse&, const GeminiRequest&) {
        const int now = ++current;
        int prev = maxObserved.load();
        while (prev < now && !maxObserved.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(50ms);
        --current;
      },
      TestServer::DefaultConfig().withMaxConnections(2));

  std::vector<std::string> responses(kNbClients);
  {
    std::vector<std::jthread> clients;
    for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
      clients.emplace_back([&, clientPos, port = ts.port()] {
        responses[static_cast<std::size_t>(clientPos)] = Request(port, "gemini://localhost/");
      });
    }
  }
  for (const auto& resp : responses) {
    EXPECT_EQ(test::parseResponse(resp).status, 20);
  }
  EXPECT_GE(maxObserved.load(), 1);
  EXPECT_LE(maxObserved.load(), 2);
}

TEST(GeminiServer, ShutdownFromHandler) {
  std::atomic<GeminiServer*> serverPtr{nullptr};
  TestServer ts([&serverPtr](GeminiResponse& resp, const GeminiRequest&) {
    serverPtr.load()->shutdown();
    resp.appendBody("bye");
  });
  serverPtr = &ts.server;
  EXPECT_EQ(Request(ts.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\nbye");
  ts.stop();
  EXPECT_FALSE(ts.runError);
}

TEST(GeminiServer, RequestReadTimeoutClosesSilently) {
  TestServer ts(HelloHandler, TestServer::DefaultConfig().withRequestReadTimeout(50ms));
  test::ClientConnection client(ts.port());
  test::sendAll(client.fd(), "gemini://local");
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(test::recvUntilClosed(client.fd(), 3000ms), "");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
}

TEST(GeminiServerLifecycle, ShutdownWhenIdleIsNoop) {
  GeminiServer server;
  server.shutdown();
  server.shutdown();
  EXPECT_FALSE(server.isRunning());
  EXPECT_EQ(server.port(), 0);
  EXPECT_EQ(server.nbActiveConnections(), 0U);
}

TEST(GeminiServerLifecycle, CanRunAgainAfterShutdown) {
  GeminiServer server;
  for (int round = 0; round < 2; ++round) {
    std::jthread runner([&server] { server.run(TestServer::DefaultConfig(), HelloHandler); });
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (server.port() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(2ms);
    }
    ASSERT_NE(server.port(), 0);
    EXPECT_EQ(Request(server.port(), "gemini://localhost/"), "20 text/gemini; charset=UTF-8\r\nHello, world!");
    server.shutdown();
    runner.join();
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.port(), 0);
  }
}

TEST(GeminiServerLifecycle, RunWhileRunningThrows) {
  TestServer ts(HelloHandler);
  EXPECT_THROW(ts.server.run(TestServer::DefaultConfig(), HelloHandler), std::logic_error);
  // the running instance is unaffected
  EXPECT_TRUE(ts.server.isRunning());
  EXPECT_EQ(test::parseResponse(Request(ts.port(), "gemini://localhost/")).status, 20);
}

TEST(GeminiServerLifecycle, InvalidArguments) {
  GeminiServer server;
  EXPECT_THROW(server.run(TestServer::DefaultConfig().withMaxConnections(0), HelloHandler), std::invalid_argument);
  EXPECT_THROW(server.run(TestServer::DefaultConfig(), GeminiServer::Handler{}), std::invalid_argument);
  EXPECT_FALSE(server.isRunning());
}

TEST(GeminiServerLifecycle, BindFailureThrowsSystemError) {
  Socket occupier(Socket::Type::Stream);
  uint16_t port = 0;
  occupier.bindAndListen("127.0.0.1", false, port, 1);

  GeminiServer server;
  EXPECT_THROW(server.run(TestServer::DefaultConfig().withPort(port), HelloHandler), std::system_error);
  EXPECT_FALSE(server.isRunning());
  EXPECT_EQ(server.port(), 0);
}
