#pragma once

#include <notary/common/sleeper.hpp>
#include <notary/rpc/node_client.hpp>
#include <notary/schema/commitment.hpp>
#include <notary/schema/identity.hpp>
#include <notary/schema/note_metadata.hpp>
#include <notary/service/funding_coordinator.hpp>
#include <notary/service/identity_provisioner.hpp>
#include <notary/service/note_codec.hpp>
#include <notary/service/retry.hpp>
#include <notary/storage/commitment_ledger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>

namespace notary::service {

struct commitment_options final {
  /// Whole sequence: fund, fetch params, sign, submit, confirm.
  retry_policy commit_retry{.attempts = 3,
                            .base_delay = std::chrono::milliseconds{2000},
                            .linear_backoff = true};
  retry_policy params_retry{.attempts = 3,
                            .base_delay = std::chrono::milliseconds{1000},
                            .linear_backoff = true};
  uint64_t confirmation_rounds{10};
  bool ensure_funding{true};
  /// Application and format version written into every note.
  notary::schema::note_metadata_t note_template;
};

/// Commits fingerprints to the ledger as zero value self transfers.
///
/// Commits for the same address are serialized; different addresses proceed
/// in parallel.
class commitment_service final {
 public:
  commitment_service(const identity_provisioner& provisioner,
                     funding_coordinator& funding,
                     notary::rpc::node_client& node,
                     const note_codec& codec,
                     commitment_options options,
                     notary::common::sleeper_t sleeper,
                     notary::common::millis_clock_t clock);

  /// Throws invalid_identity before any network activity when `identity`
  /// does not validate, and commitment_failed once every attempt failed.
  notary::schema::commitment_t commit(
      const notary::schema::identity_t& identity,
      const notary::schema::fingerprint_t& fingerprint,
      const std::stop_token& stop = {});

  /// Addresses with a commit running or waiting.
  std::size_t active_addresses() const;

 private:
  struct address_lock final {
    std::mutex mutex;
    uint32_t holders{0};
  };

  /// Holds the lock for one address. The map entry is erased when the last
  /// holder releases it.
  class address_guard final {
   public:
    address_guard(commitment_service& service, const std::string& address);
    ~address_guard();
    address_guard(const address_guard&) = delete;
    address_guard& operator=(const address_guard&) = delete;

   private:
    commitment_service& service_;
    std::string address_;
    address_lock* lock_{nullptr};
  };

  notary::schema::commitment_t attempt_commit(
      const notary::schema::identity_t& identity,
      const notary::schema::fingerprint_t& fingerprint,
      const notary::schema::bytes_t& note,
      const std::stop_token& stop);

  const identity_provisioner& provisioner_;
  funding_coordinator& funding_;
  notary::rpc::node_client& node_;
  const note_codec& codec_;
  commitment_options options_;
  notary::common::sleeper_t sleeper_;
  notary::common::millis_clock_t clock_;

  mutable std::mutex locks_mutex_;
  std::unordered_map<std::string, address_lock> address_locks_;
};

/// Commits `fingerprint` and records the result under `record_id`. The
/// store is opened by the caller before anything reaches the ledger, and the
/// transaction id is logged before the record is written.
notary::schema::commitment_t commit_and_record(
    commitment_service& service,
    const notary::storage::ledger_storage_t& store,
    std::string_view record_id,
    const notary::schema::identity_t& identity,
    const notary::schema::fingerprint_t& fingerprint,
    const std::stop_token& stop = {});

}  // namespace notary::service
