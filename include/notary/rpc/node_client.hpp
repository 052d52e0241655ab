#pragma once

#include <notary/schema/account_info.hpp>
#include <notary/schema/node_status.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_info.hpp>
#include <notary/schema/transaction_params.hpp>

#include <string>
#include <string_view>

namespace notary::rpc {

/// Ledger node boundary. Implementations throw rpc_error on transport or
/// HTTP failures.
class node_client {
 public:
  virtual ~node_client() = default;

  virtual notary::schema::node_status_t status() = 0;
  /// Blocks until the node has seen a block after `round`.
  virtual notary::schema::node_status_t status_after_block(
      notary::schema::round_t round) = 0;
  virtual notary::schema::transaction_params_t transaction_params() = 0;
  /// A missing account is reported with a zero amount.
  virtual notary::schema::account_info_t account_info(
      std::string_view address) = 0;
  /// Returns the transaction id the node assigned.
  virtual std::string submit_transaction(
      const notary::schema::bytes_view_t& signed_transaction) = 0;
  virtual notary::schema::transaction_info_t transaction_info(
      std::string_view transaction_id) = 0;

  /// Polls the pending transaction once per round for at most `max_rounds`
  /// rounds. Throws transaction_rejected when the node reports a pool error
  /// and confirmation_timeout when the rounds run out.
  virtual notary::schema::transaction_info_t wait_for_confirmation(
      std::string_view transaction_id,
      uint64_t max_rounds);
};

}  // namespace notary::rpc
