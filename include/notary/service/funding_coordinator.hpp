#pragma once

#include <notary/common/sleeper.hpp>
#include <notary/rpc/faucet_client.hpp>
#include <notary/rpc/node_client.hpp>
#include <notary/schema/funding_source.hpp>
#include <notary/service/retry.hpp>

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace notary::service {

/// 0.1 ALGO, the ledger's minimum account balance.
inline constexpr auto kDefaultMinimumBalance =
    notary::schema::microalgos_t{100000};

/// Testnet dispenser, Algorand bank and AlgoExplorer faucet, in that order.
std::vector<notary::schema::funding_source_t> default_funding_sources();

struct funding_options final {
  notary::schema::microalgos_t minimum_balance{kDefaultMinimumBalance};
  /// Wait between a faucet acknowledgment and the balance re-check.
  std::chrono::milliseconds settle_delay{5000};
  retry_policy balance_retry{.attempts = 3,
                             .base_delay = std::chrono::milliseconds{1000},
                             .linear_backoff = true};
  std::vector<notary::schema::funding_source_t> sources{
      default_funding_sources()};
};

/// Tops an account up from faucets until it holds a minimum balance.
class funding_coordinator final {
 public:
  funding_coordinator(notary::rpc::node_client& node,
                      notary::rpc::faucet_client& faucet,
                      funding_options options,
                      notary::common::sleeper_t sleeper);

  /// True once the balance of `address` is at least `minimum_balance`.
  /// Returns false, with manual funding guidance logged, when the balance
  /// cannot be read or every faucet fails or `stop` is requested.
  bool ensure_funded(std::string_view address,
                     notary::schema::microalgos_t minimum_balance,
                     const std::stop_token& stop = {}) const;
  bool ensure_funded(std::string_view address,
                     const std::stop_token& stop = {}) const;

  /// Balance with retries; nullopt when every attempt failed.
  std::optional<notary::schema::microalgos_t> balance(
      std::string_view address,
      const std::stop_token& stop = {}) const;

  /// Human readable steps for funding `address` by hand.
  std::vector<std::string> manual_funding_guidance(
      std::string_view address) const;

  const funding_options& options() const;

 private:
  void log_manual_guidance(std::string_view address) const;

  notary::rpc::node_client& node_;
  notary::rpc::faucet_client& faucet_;
  funding_options options_;
  notary::common::sleeper_t sleeper_;
};

}  // namespace notary::service
