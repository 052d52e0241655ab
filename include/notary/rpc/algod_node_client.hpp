#pragma once

#include <notary/rpc/http_client.hpp>
#include <notary/rpc/node_client.hpp>

#include <chrono>
#include <string>

namespace notary::rpc {

inline constexpr auto kDefaultNodeUrl =
    std::string_view{"https://testnet-api.4160.nodely.dev"};

struct node_settings final {
  std::string url{kDefaultNodeUrl};
  /// Sent as X-Algo-API-Token when not empty.
  std::string token;
  std::chrono::seconds timeout{10};
};

/// node_client over the algod v2 REST API.
class algod_node_client final : public node_client {
 public:
  /// Throws std::invalid_argument when `settings.url` is not an http(s) URL.
  explicit algod_node_client(node_settings settings);

  notary::schema::node_status_t status() override;
  notary::schema::node_status_t status_after_block(
      notary::schema::round_t round) override;
  notary::schema::transaction_params_t transaction_params() override;
  notary::schema::account_info_t account_info(
      std::string_view address) override;
  std::string submit_transaction(
      const notary::schema::bytes_view_t& signed_transaction) override;
  notary::schema::transaction_info_t transaction_info(
      std::string_view transaction_id) override;

 private:
  http_response checked(http_request request);
  http_response get(std::string target);

  node_settings settings_;
  endpoint endpoint_;
  http_client http_;
};

}  // namespace notary::rpc
