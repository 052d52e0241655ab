#include <notary/rpc/errors.hpp>
#include <notary/rpc/http_client.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <charconv>

namespace notary::rpc {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

constexpr auto kUserAgent = std::string_view{"notary/0.1"};

http::request<http::string_body> make_request(const endpoint& target,
                                              const http_request& request) {
  auto verb = request.method == http_method_t::post ? http::verb::post
                                                    : http::verb::get;
  auto message = http::request<http::string_body>{
      verb, target.base_path + request.target, 11};
  message.set(http::field::host, target.host);
  message.set(http::field::user_agent,
              beast::string_view{kUserAgent.data(), kUserAgent.size()});
  message.set(http::field::accept, "application/json");
  for (const auto& [name, value] : request.headers) {
    message.set(name, value);
  }
  if (request.method == http_method_t::post) {
    if (!request.content_type.empty()) {
      message.set(http::field::content_type, request.content_type);
    }
    message.body() = request.body;
    message.prepare_payload();
  }
  return message;
}

template <typename Stream>
http_response exchange(Stream& stream,
                       const http::request<http::string_body>& message,
                       const endpoint& target) {
  auto ec = beast::error_code{};
  http::write(stream, message, ec);
  if (ec) {
    throw rpc_error{0, "write to " + target.host + " failed: " + ec.message()};
  }

  auto buffer = beast::flat_buffer{};
  auto response = http::response<http::string_body>{};
  http::read(stream, buffer, response, ec);
  if (ec) {
    throw rpc_error{0, "read from " + target.host + " failed: " + ec.message()};
  }
  return http_response{.status = response.result_int(),
                       .body = std::move(response.body())};
}

}  // namespace

std::optional<endpoint> parse_url(std::string_view url) {
  auto out = endpoint{};
  if (url.starts_with("https://")) {
    out.tls = true;
    out.port = 443;
    url.remove_prefix(8);
  } else if (url.starts_with("http://")) {
    out.tls = false;
    out.port = 80;
    url.remove_prefix(7);
  } else {
    return std::nullopt;
  }

  auto path_start = url.find('/');
  auto authority = url.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    auto path = url.substr(path_start);
    while (!path.empty() && path.back() == '/') {
      path.remove_suffix(1);
    }
    out.base_path = std::string{path};
  }

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto port_text = authority.substr(colon + 1);
    auto port = uint16_t{};
    auto [ptr, ec] = std::from_chars(
        port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
        port == 0) {
      return std::nullopt;
    }
    out.port = port;
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  out.host = std::string{authority};
  return out;
}

http_client::http_client(const std::chrono::seconds timeout)
    : timeout_{timeout} {}

http_response http_client::send(const endpoint& target,
                                const http_request& request) const {
  auto io = asio::io_context{};
  auto ec = beast::error_code{};

  auto resolver = tcp::resolver{io};
  auto results =
      resolver.resolve(target.host, std::to_string(target.port), ec);
  if (ec) {
    throw rpc_error{0, "resolve " + target.host + " failed: " + ec.message()};
  }

  auto message = make_request(target, request);
  spdlog::debug("{} {}{}", std::string_view{message.method_string().data(),
                                   message.method_string().size()},
                target.host, std::string_view{message.target().data(), message.target().size()});

  if (!target.tls) {
    auto stream = beast::tcp_stream{io};
    stream.expires_after(timeout_);
    stream.connect(results, ec);
    if (ec) {
      throw rpc_error{0,
                      "connect to " + target.host + " failed: " + ec.message()};
    }
    auto response = exchange(stream, message, target);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      spdlog::debug("shutdown with {}: {}", target.host, ec.message());
    }
    return response;
  }

  auto ssl = asio::ssl::context{asio::ssl::context::tls_client};
  ssl.set_default_verify_paths(ec);
  if (ec) {
    throw rpc_error{0, "trust store unavailable: " + ec.message()};
  }
  ssl.set_verify_mode(asio::ssl::verify_peer);

  auto stream = beast::ssl_stream<beast::tcp_stream>{io, ssl};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
    throw rpc_error{0, "failed to set SNI host name for " + target.host};
  }
  stream.set_verify_callback(asio::ssl::host_name_verification{target.host});

  beast::get_lowest_layer(stream).expires_after(timeout_);
  beast::get_lowest_layer(stream).connect(results, ec);
  if (ec) {
    throw rpc_error{0,
                    "connect to " + target.host + " failed: " + ec.message()};
  }
  stream.handshake(asio::ssl::stream_base::client, ec);
  if (ec) {
    throw rpc_error{0,
                    "TLS handshake with " + target.host + " failed: " +
                        ec.message()};
  }

  auto response = exchange(stream, message, target);
  stream.shutdown(ec);
  if (ec && ec != asio::ssl::error::stream_truncated &&
      ec != asio::error::eof) {
    spdlog::debug("TLS shutdown with {}: {}", target.host, ec.message());
  }
  return response;
}

}  // namespace notary::rpc
