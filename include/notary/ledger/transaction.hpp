#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_params.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace notary::ledger {

/// Rounds a transaction stays valid after its first valid round.
inline constexpr auto kValidityWindow = notary::schema::round_t{1000};
/// Bytes a signature adds to the encoded transaction, used for fee estimation.
inline constexpr auto kSignatureOverhead = std::size_t{75};
inline constexpr auto kMaxNoteLength = std::size_t{1024};

template <uint16_t Version>
struct payment_transaction;

template <>
struct payment_transaction<1> final {
  uint16_t version{1};
  notary::schema::public_key_t sender{};
  notary::schema::public_key_t receiver{};
  notary::schema::microalgos_t amount{};
  notary::schema::microalgos_t fee{};
  notary::schema::round_t first_valid{};
  notary::schema::round_t last_valid{};
  std::string genesis_id;
  notary::schema::hash32_t genesis_hash{};
  notary::schema::bytes_t note;
};

using payment_transaction_t = payment_transaction<1>;

/// Zero value payment from `account` to itself carrying `note`, valid for
/// kValidityWindow rounds from the node's current round with the fee
/// max(min_fee, fee_per_byte * (encoded size + kSignatureOverhead)).
payment_transaction_t make_self_payment(
    const notary::schema::public_key_t& account,
    const notary::schema::transaction_params_t& params,
    notary::schema::bytes_t note);

/// Canonical MessagePack: sorted keys, zero and empty fields omitted.
notary::schema::bytes_t encode_transaction(
    const payment_transaction_t& transaction);

/// "TX" domain separator followed by the canonical encoding.
notary::schema::bytes_t signing_payload(
    const payment_transaction_t& transaction);

/// base32 (no padding) of SHA-512/256 over the signing payload.
std::string transaction_id(const payment_transaction_t& transaction);

/// Signed form `{sig, txn}` ready for submission.
std::optional<notary::schema::bytes_t> sign_transaction(
    const payment_transaction_t& transaction,
    const notary::schema::ed25519_seed_t& seed);

}  // namespace notary::ledger
