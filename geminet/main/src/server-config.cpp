#include "geminet/server-config.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace geminet {

ServerConfig& ServerConfig::withBindAddress(std::string bindAddress) {
  this->bindAddress = std::move(bindAddress);
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReuseAddress(bool on) {
  this->reuseAddress = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxConnections(uint32_t maxConnections) {
  this->maxConnections = maxConnections;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

ServerConfig& ServerConfig::withRequestReadTimeout(std::chrono::milliseconds timeout) {
  this->requestReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withWriteTimeout(std::chrono::milliseconds timeout) {
  this->writeTimeout = timeout;
  return *this;
}

void ServerConfig::validate() const {
  in_addr addr{};
  if (::inet_pton(AF_INET, bindAddress.c_str(), &addr) != 1) {
    throw std::invalid_argument(fmt::format("bindAddress '{}' is not a valid IPv4 address", bindAddress));
  }
  if (maxConnections == 0) {
    throw std::invalid_argument("maxConnections must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), maxConnections)) {
    throw std::invalid_argument("maxConnections value is too large");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("pollInterval value is too large");
  }
  if (requestReadTimeout.count() < 0) {
    throw std::invalid_argument("requestReadTimeout must be non-negative");
  }
  if (writeTimeout.count() < 0) {
    throw std::invalid_argument("writeTimeout must be non-negative");
  }
}

}  // namespace geminet
