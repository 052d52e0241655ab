#include <notary/rpc/algod_json.hpp>
#include <notary/rpc/algod_node_client.hpp>
#include <notary/rpc/errors.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace notary::rpc {

namespace {

endpoint require_endpoint(const std::string& url) {
  auto parsed = parse_url(url);
  if (!parsed) {
    throw std::invalid_argument{"invalid node url: " + url};
  }
  return *parsed;
}

template <typename T>
T require(std::optional<T> parsed, const std::string_view what) {
  if (!parsed) {
    throw rpc_error{502, "malformed " + std::string{what} + " response"};
  }
  return std::move(*parsed);
}

}  // namespace

algod_node_client::algod_node_client(node_settings settings)
    : settings_{std::move(settings)},
      endpoint_{require_endpoint(settings_.url)},
      http_{settings_.timeout} {}

http_response algod_node_client::checked(http_request request) {
  if (!settings_.token.empty()) {
    request.headers.emplace_back("X-Algo-API-Token", settings_.token);
  }
  auto response = http_.send(endpoint_, request);
  if (!response.ok()) {
    auto message = parse_error_message(response.body);
    throw rpc_error{response.status,
                    "node returned " + std::to_string(response.status) + ": " +
                        message,
                    std::move(response.body)};
  }
  return response;
}

http_response algod_node_client::get(std::string target) {
  auto request = http_request{};
  request.method = http_method_t::get;
  request.target = std::move(target);
  return checked(std::move(request));
}

notary::schema::node_status_t algod_node_client::status() {
  return require(parse_node_status(get("/v2/status").body), "status");
}

notary::schema::node_status_t algod_node_client::status_after_block(
    const notary::schema::round_t round) {
  return require(
      parse_node_status(
          get("/v2/status/wait-for-block-after/" + std::to_string(round)).body),
      "status");
}

notary::schema::transaction_params_t algod_node_client::transaction_params() {
  return require(parse_transaction_params(get("/v2/transactions/params").body),
                 "transaction params");
}

notary::schema::account_info_t algod_node_client::account_info(
    const std::string_view address) {
  try {
    auto info = require(
        parse_account_info(get("/v2/accounts/" + std::string{address}).body),
        "account");
    if (info.address.empty()) {
      info.address = std::string{address};
    }
    return info;
  } catch (const rpc_error& e) {
    if (e.status() != 404) {
      throw;
    }
    spdlog::info("account {} does not exist yet, treating balance as 0",
                 address);
    auto info = notary::schema::account_info_t{};
    info.address = std::string{address};
    return info;
  }
}

std::string algod_node_client::submit_transaction(
    const notary::schema::bytes_view_t& signed_transaction) {
  auto request = http_request{};
  request.method = http_method_t::post;
  request.target = "/v2/transactions";
  request.content_type = "application/x-binary";
  request.body = notary::schema::make_string(signed_transaction);
  return require(parse_submitted_transaction_id(
                     checked(std::move(request)).body),
                 "submit");
}

notary::schema::transaction_info_t algod_node_client::transaction_info(
    const std::string_view transaction_id) {
  return require(
      parse_transaction_info(get("/v2/transactions/pending/" +
                                 std::string{transaction_id} + "?format=json")
                                 .body),
      "pending transaction");
}

}  // namespace notary::rpc
