#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: transaction lookup result.
// A node may report the note in one of three places depending on its
// response layout; each is kept as the base64 text the node returned.
namespace notary::schema {

template <uint16_t Version>
struct transaction_info;

template <>
struct transaction_info<1> final {
  uint16_t version{1};
  std::optional<round_t> confirmed_round;
  std::string pool_error;
  // txn.txn.note
  std::optional<std::string> signed_note;
  // transaction.note
  std::optional<std::string> transaction_note;
  // txn.note
  std::optional<std::string> flat_note;
};

using transaction_info_t = transaction_info<1>;

}  // namespace notary::schema
