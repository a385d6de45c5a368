#ifndef __TT_RELAY_ENDPOINT__
#define __TT_RELAY_ENDPOINT__

#include "Headers.hpp"

namespace tt {

/**
 * @brief Thrown when a relay URL cannot be parsed.
 */
class RelayEndpointException : public std::runtime_error {
 public:
  explicit RelayEndpointException(const string& msg)
      : std::runtime_error(msg) {}
};

// Parsed components of a ws[s]://host[:port][/path] relay URL
struct RelayEndpoint {
  bool secure = true;
  string host;
  string port = "443";
  string target = "/";

  // Value for the Host header, e.g. "relay.example.com:8443"
  string hostHeader() const {
    bool defaultPort = (secure && port == "443") || (!secure && port == "80");
    string h = host.find(':') != string::npos ? "[" + host + "]" : host;
    return defaultPort ? h : h + ":" + port;
  }

  string toString() const {
    return string(secure ? "wss://" : "ws://") + hostHeader() + target;
  }
};

// Parse a relay URL. Handles IPv6 hosts in bracket notation: ws://[::1]:8080/
inline RelayEndpoint parseRelayUrl(const string& url) {
  RelayEndpoint result;
  string remaining;
  if (url.rfind("wss://", 0) == 0) {
    result.secure = true;
    result.port = "443";
    remaining = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    result.secure = false;
    result.port = "80";
    remaining = url.substr(5);
  } else {
    throw RelayEndpointException("relay url must use ws:// or wss:// (got '" +
                                 url + "')");
  }

  string authority = remaining;
  auto slashIndex = remaining.find('/');
  if (slashIndex != string::npos) {
    authority = remaining.substr(0, slashIndex);
    result.target = remaining.substr(slashIndex);
  }

  string portString;
  if (!authority.empty() && authority[0] == '[') {
    auto closeBracket = authority.find(']');
    if (closeBracket == string::npos) {
      throw RelayEndpointException("unterminated ipv6 host in '" + url + "'");
    }
    result.host = authority.substr(1, closeBracket - 1);
    if (closeBracket + 1 < authority.length()) {
      if (authority[closeBracket + 1] != ':') {
        throw RelayEndpointException("invalid authority in '" + url + "'");
      }
      portString = authority.substr(closeBracket + 2);
    }
  } else {
    auto colonIndex = authority.find(':');
    result.host = authority.substr(0, colonIndex);
    if (colonIndex != string::npos) {
      portString = authority.substr(colonIndex + 1);
    }
  }

  if (result.host.empty()) {
    throw RelayEndpointException("relay url missing host: '" + url + "'");
  }
  if (!portString.empty()) {
    if (portString.find_first_not_of("0123456789") != string::npos ||
        portString.length() > 5 || stoi(portString) > 65535) {
      throw RelayEndpointException("invalid port '" + portString + "' in '" +
                                   url + "'");
    }
    result.port = portString;
  }
  return result;
}

// Returns a copy of endpoint with path appended to its target
inline RelayEndpoint withPath(RelayEndpoint endpoint, const string& path) {
  string target = endpoint.target;
  while (!target.empty() && target.back() == '/') {
    target.pop_back();
  }
  endpoint.target = target + path;
  return endpoint;
}

}  // namespace tt

#endif  // __TT_RELAY_ENDPOINT__
