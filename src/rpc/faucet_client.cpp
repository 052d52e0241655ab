#include <notary/rpc/errors.hpp>
#include <notary/rpc/faucet_client.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace notary::rpc {

namespace {

std::string form_escape(const std::string_view value) {
  static constexpr auto kHex = std::string_view{"0123456789ABCDEF"};
  auto out = std::string{};
  for (const auto c : value) {
    auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(kHex[byte >> 4u]);
      out.push_back(kHex[byte & 0x0Fu]);
    }
  }
  return out;
}

}  // namespace

std::string make_faucet_body(const notary::schema::funding_source_t& source,
                             const std::string_view address) {
  if (source.body_format == notary::schema::body_format_t::json) {
    auto body = Json::Value{Json::objectValue};
    body["account"] = std::string{address};
    auto builder = Json::StreamWriterBuilder{};
    builder["indentation"] = "";
    return Json::writeString(builder, body);
  }
  return "account=" + form_escape(address);
}

http_faucet_client::http_faucet_client(const std::chrono::seconds timeout)
    : http_{timeout} {}

void http_faucet_client::request_funds(
    const notary::schema::funding_source_t& source,
    const std::string_view address) {
  auto target = parse_url(source.url);
  if (!target) {
    throw rpc_error{0, "invalid faucet url: " + source.url};
  }

  auto request = http_request{};
  request.method = http_method_t::post;
  request.target = "/";
  if (!target->base_path.empty()) {
    request.target = target->base_path;
    target->base_path.clear();
  }
  request.body = make_faucet_body(source, address);
  request.content_type =
      source.body_format == notary::schema::body_format_t::json
          ? "application/json"
          : "application/x-www-form-urlencoded";

  auto response = http_.send(*target, request);
  if (!response.ok()) {
    throw rpc_error{response.status,
                    source.name + " returned HTTP " +
                        std::to_string(response.status),
                    std::move(response.body)};
  }
  spdlog::debug("{} acknowledged funding request with HTTP {}", source.name,
                response.status);
}

}  // namespace notary::rpc
