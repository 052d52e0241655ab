#include <notary/rpc/errors.hpp>
#include <notary/rpc/node_client.hpp>

#include <spdlog/spdlog.h>

namespace notary::rpc {

notary::schema::transaction_info_t node_client::wait_for_confirmation(
    const std::string_view transaction_id,
    const uint64_t max_rounds) {
  auto start_round = status().last_round + 1;
  auto current_round = start_round;
  while (current_round < start_round + max_rounds) {
    auto info = transaction_info(transaction_id);
    if (info.confirmed_round.has_value() && *info.confirmed_round > 0) {
      return info;
    }
    if (!info.pool_error.empty()) {
      throw transaction_rejected{"transaction rejected with pool error: " +
                                 info.pool_error};
    }
    spdlog::debug("transaction {} pending at round {}", transaction_id,
                  current_round);
    status_after_block(current_round);
    ++current_round;
  }
  throw confirmation_timeout{"transaction " + std::string{transaction_id} +
                             " not confirmed after " +
                             std::to_string(max_rounds) + " rounds"};
}

}  // namespace notary::rpc
