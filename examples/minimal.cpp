#include <geminet/geminet.hpp>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string_view>

using namespace geminet;

int main(int argc, char **argv) {
  uint16_t port = 1965;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  std::cout << "geminet " << version() << " minimal server listening on port " << port << '\n';

  try {
    // Blocking, until Ctrl+C
    ListenAndServe("0.0.0.0", port, [](GeminiResponse &resp, const GeminiRequest &req) {
      resp.appendBody("# Hello from geminet\n\n");
      resp.appendBody("You requested host ");
      resp.appendBody(req.host());
      resp.appendBody(" and path /");
      resp.appendBody(req.path().value_or(""));
      resp.appendBody("\n");
      if (req.query()) {
        resp.appendBody("Query: ");
        resp.appendBody(*req.query());
        resp.appendBody("\n");
      }
      // returning without flush lets the server send it as text/gemini
    });
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
