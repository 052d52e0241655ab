#pragma once

#include <notary/common/sleeper.hpp>
#include <notary/rpc/node_client.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_info.hpp>
#include <notary/schema/verification_outcome.hpp>
#include <notary/service/note_codec.hpp>
#include <notary/service/retry.hpp>

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace notary::service {

struct verification_options final {
  /// Fixed delay between transaction lookups.
  retry_policy fetch_retry{.attempts = 3,
                           .base_delay = std::chrono::milliseconds{2000},
                           .linear_backoff = false};
  /// Wait before the fallback search starts.
  std::chrono::milliseconds fallback_delay{5000};
  retry_policy fallback_retry{.attempts = 3,
                              .base_delay = std::chrono::milliseconds{3000},
                              .linear_backoff = true};
};

/// Checks that a committed transaction's note carries a fingerprint.
class verification_service final {
 public:
  verification_service(notary::rpc::node_client& node,
                       const note_codec& codec,
                       verification_options options,
                       notary::common::sleeper_t sleeper);

  /// Never throws; failures and cancellation yield a negative outcome.
  ///
  /// A note found on the first lookup is checked with note_codec::matches.
  /// When the confirmed transaction carries no note the lookup is repeated
  /// and a note found that way is checked by plain containment and reported
  /// as degraded.
  notary::schema::verification_outcome_t verify(
      const notary::schema::fingerprint_t& fingerprint,
      std::string_view transaction_id,
      const std::stop_token& stop = {}) const;

  /// signed transaction note, then transaction.note, then the flat txn.note.
  static std::optional<std::string> locate_note(
      const notary::schema::transaction_info_t& info);

  /// base64 decoded note text, or `note` itself when it is not base64.
  static std::string decode_note(std::string_view note);

 private:
  notary::schema::verification_outcome_t fallback_search(
      const notary::schema::fingerprint_t& fingerprint,
      std::string_view transaction_id,
      const std::stop_token& stop) const;

  notary::rpc::node_client& node_;
  const note_codec& codec_;
  verification_options options_;
  notary::common::sleeper_t sleeper_;
};

}  // namespace notary::service
