#include <geminet/geminet.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace {

// Serves regular files below root. "dir/" serves "dir/index.gmi". Paths escaping root are refused.
void ServeFile(const std::filesystem::path &root, geminet::GeminiResponse &resp, const geminet::GeminiRequest &req) {
  std::string_view relPath = req.path().value_or("");
  std::filesystem::path path = (root / relPath).lexically_normal();
  if (relPath.empty() || relPath.ends_with('/')) {
    path /= "index.gmi";
  }
  const auto relToRoot = path.lexically_relative(root);
  if (relToRoot.empty() || *relToRoot.begin() == "..") {
    resp.writeHeader(geminet::gemini::StatusCodeBadRequest, "Path outside of capsule");
    return;
  }

  std::ifstream file(path, std::ios::binary);
  if (!std::filesystem::is_regular_file(path) || !file) {
    resp.status(geminet::gemini::StatusCodeNotFound);
    return;
  }
  resp.appendBody(std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()));
  resp.flush(geminet::MimeType::FromFileName(path.filename().string()));
}

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 1965;
  std::filesystem::path root = ".";
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }
  if (argc > 2) {
    root = argv[2];
  }

  geminet::SignalHandler::Enable();

  try {
    geminet::ServerConfig cfg;
    cfg.withPort(port).withReuseAddress().withRequestReadTimeout(std::chrono::seconds{10});

    std::cout << "Starting static file example on port: " << port << " serving root: " << root << '\n';

    geminet::GeminiServer server;
    server.run(std::move(cfg), [root = std::filesystem::weakly_canonical(root)](geminet::GeminiResponse &resp,
                                                                      const geminet::GeminiRequest &req) {
      ServeFile(root, resp, req);
    });
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
