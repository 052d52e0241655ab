#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace notary::rpc {

struct endpoint final {
  bool tls{true};
  std::string host;
  uint16_t port{443};
  /// Path prefix without a trailing slash, "" for the root.
  std::string base_path;
};

/// Accepts http:// and https:// URLs with an optional port and path.
std::optional<endpoint> parse_url(std::string_view url);

enum class http_method_t : uint8_t { get = 0, post = 1 };

using http_headers_t = std::vector<std::pair<std::string, std::string>>;

struct http_request final {
  http_method_t method{http_method_t::get};
  std::string target{"/"};
  std::string body;
  std::string content_type;
  http_headers_t headers;
};

struct http_response final {
  unsigned status{};
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/// Blocking HTTP/1.1 client, one connection per request. TLS peers are
/// verified against the system trust store.
class http_client final {
 public:
  explicit http_client(std::chrono::seconds timeout = std::chrono::seconds{10});

  /// Throws rpc_error with status 0 when the exchange fails before a
  /// response is read. Non-2xx responses are returned, not thrown.
  http_response send(const endpoint& target, const http_request& request) const;

 private:
  std::chrono::seconds timeout_;
};

}  // namespace notary::rpc
