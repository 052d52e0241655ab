#pragma once

#include <notary/rpc/errors.hpp>
#include <notary/rpc/node_client.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace notary::testing {

/// Scripted node. Queued results are consumed in order; the last one repeats
/// once the queue is down to a single entry. `*_failures` counters make the
/// next calls throw a transport rpc_error.
class fake_node_client final : public notary::rpc::node_client {
 public:
  fake_node_client() {
    params.fee_per_byte = 0;
    params.min_fee = 1000;
    params.first_valid = 1000;
    params.last_valid = 2000;
    params.genesis_id = "testnet-v1.0";
    params.genesis_hash[0] = 0x48;
  }

  notary::schema::node_status_t status() override {
    auto lock = std::lock_guard{mutex};
    ++status_calls;
    auto out = notary::schema::node_status_t{};
    out.last_round = last_round;
    return out;
  }

  notary::schema::node_status_t status_after_block(
      const notary::schema::round_t round) override {
    auto lock = std::lock_guard{mutex};
    waited_rounds.push_back(round);
    last_round = round + 1;
    auto out = notary::schema::node_status_t{};
    out.last_round = last_round;
    return out;
  }

  notary::schema::transaction_params_t transaction_params() override {
    auto lock = std::lock_guard{mutex};
    ++params_calls;
    if (params_failures > 0) {
      --params_failures;
      throw notary::rpc::rpc_error{0, "params unavailable"};
    }
    return params;
  }

  notary::schema::account_info_t account_info(
      const std::string_view address) override {
    auto lock = std::lock_guard{mutex};
    ++account_calls;
    if (account_failures > 0) {
      --account_failures;
      throw notary::rpc::rpc_error{0, "account lookup unavailable"};
    }
    auto out = notary::schema::account_info_t{};
    out.address = std::string{address};
    out.amount = next(balances, notary::schema::microalgos_t{0});
    return out;
  }

  std::string submit_transaction(
      const notary::schema::bytes_view_t& signed_transaction) override {
    {
      auto lock = std::lock_guard{mutex};
      submitted.push_back(notary::schema::make_bytes(signed_transaction));
      ++in_flight;
      max_in_flight = std::max(max_in_flight, in_flight);
    }
    if (submit_delay.count() > 0) {
      std::this_thread::sleep_for(submit_delay);
    }
    auto lock = std::lock_guard{mutex};
    --in_flight;
    if (!submit_errors.empty()) {
      auto error = submit_errors.front();
      submit_errors.pop_front();
      throw error;
    }
    return "TX" + std::to_string(submitted.size());
  }

  notary::schema::transaction_info_t transaction_info(
      const std::string_view transaction_id) override {
    auto lock = std::lock_guard{mutex};
    looked_up.emplace_back(transaction_id);
    if (info_failures > 0) {
      --info_failures;
      throw notary::rpc::rpc_error{0, "lookup unavailable"};
    }
    return next(infos, notary::schema::transaction_info_t{});
  }

  std::mutex mutex;
  notary::schema::round_t last_round{100};
  notary::schema::transaction_params_t params;
  std::deque<notary::schema::microalgos_t> balances;
  std::deque<notary::schema::transaction_info_t> infos;
  std::deque<notary::rpc::rpc_error> submit_errors;
  std::chrono::milliseconds submit_delay{0};
  int params_failures{0};
  int account_failures{0};
  int info_failures{0};

  int status_calls{0};
  int params_calls{0};
  int account_calls{0};
  int in_flight{0};
  int max_in_flight{0};
  std::vector<notary::schema::bytes_t> submitted;
  std::vector<std::string> looked_up;
  std::vector<notary::schema::round_t> waited_rounds;

 private:
  template <typename T>
  static T next(std::deque<T>& queue, T fallback) {
    if (queue.empty()) {
      return fallback;
    }
    auto value = queue.front();
    if (queue.size() > 1) {
      queue.pop_front();
    }
    return value;
  }
};

inline notary::schema::transaction_info_t make_confirmed(
    const notary::schema::round_t round) {
  auto info = notary::schema::transaction_info_t{};
  info.confirmed_round = round;
  return info;
}

}  // namespace notary::testing
