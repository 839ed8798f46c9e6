#include <benchmark/benchmark.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "geminet/gemini-constants.hpp"
#include "geminet/gemini-request.hpp"
#include "geminet/memory-transport.hpp"
#include "geminet/uri.hpp"

namespace {

constexpr std::string_view kShortUri = "gemini://example.com/";
constexpr std::string_view kFullUri = "gemini://sub.example.com:1965/docs/guide/index.gmi?lang=en&page=2#section-3";
constexpr std::string_view kIpLiteralUri = "gemini://[2001:db8:0:0:0:0:2:1]:1965/a/b/c";

void BM_ParseUri(benchmark::State& state, std::string_view uri) {
  for ([[maybe_unused]] auto _ : state) {
    auto res = geminet::ParseUri(uri);
    benchmark::DoNotOptimize(res);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(uri.size()));
}

BENCHMARK_CAPTURE(BM_ParseUri, short, kShortUri);
BENCHMARK_CAPTURE(BM_ParseUri, full, kFullUri);
BENCHMARK_CAPTURE(BM_ParseUri, ip_literal, kIpLiteralUri);

void BM_ParseUriLongPath(benchmark::State& state) {
  std::string uri("gemini://example.com/");
  uri.append(geminet::gemini::kMaxUriSize - uri.size(), 'p');
  for ([[maybe_unused]] auto _ : state) {
    auto res = geminet::ParseUri(uri);
    benchmark::DoNotOptimize(res);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(uri.size()));
}

BENCHMARK(BM_ParseUriLongPath);

// Request reader over an in-memory transport delivering the line in chunks of state.range(0) bytes.
void BM_ParseRequest(benchmark::State& state) {
  const std::string line = std::string(kFullUri) + "\r\n";
  std::array<char, geminet::gemini::kMaxRequestLineSize> buffer;
  for ([[maybe_unused]] auto _ : state) {
    geminet::test::MemoryTransport transport(line, static_cast<std::size_t>(state.range(0)));
    auto res = geminet::ParseRequest(transport, buffer);
    benchmark::DoNotOptimize(res);
  }
}

BENCHMARK(BM_ParseRequest)->Arg(8)->Arg(64)->Arg(2048);

}  // namespace

BENCHMARK_MAIN();
