#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

namespace URL {

struct Endpoint {
  std::string host;
  std::string port;
};

// Splits "host[:port]" or "[v6addr][:port]"; missing port yields
// default_port. Returns nullopt on an empty host or a malformed port.
inline std::optional<Endpoint> ParseHostPort(const std::string &hostport,
                                             const std::string &default_port) {
  std::string host;
  std::string port = default_port;
  if (!hostport.empty() && hostport.front() == '[') {
    auto close = hostport.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    host = hostport.substr(1, close - 1);
    std::string rest = hostport.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return std::nullopt;
      }
      port = rest.substr(1);
    }
  } else {
    auto colon = hostport.rfind(':');
    if (colon != std::string::npos) {
      host = hostport.substr(0, colon);
      port = hostport.substr(colon + 1);
    } else {
      host = hostport;
    }
  }
  if (host.empty() || port.empty() || port.size() > 5) {
    return std::nullopt;
  }
  unsigned long value = 0;
  for (char c : port) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  if (value > 65535) {
    return std::nullopt;
  }
  return Endpoint{.host = host, .port = port};
}

// Broker address: "tcp://host[:port]", "mqtt://host[:port]" or bare
// "host[:port]". Port defaults to 1883.
inline std::optional<Endpoint> ParseBrokerUrl(const std::string &url) {
  std::string rest = url;
  if (boost::algorithm::istarts_with(rest, "tcp://")) {
    rest = rest.substr(6);
  } else if (boost::algorithm::istarts_with(rest, "mqtt://")) {
    rest = rest.substr(7);
  } else if (rest.find("://") != std::string::npos) {
    return std::nullopt;
  }
  if (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }
  if (rest.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return ParseHostPort(rest, "1883");
}

} // namespace URL
