#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: commitment.
// Receipt of a confirmed zero value self transfer whose note carries
// `fingerprint`. Persisted by the commitment ledger keyed by record id.
namespace notary::schema {

template <uint16_t Version>
struct commitment;

template <>
struct commitment<1> final {
  uint16_t version{1};
  std::string transaction_id;
  round_t confirmed_round{};
  timestamp_milliseconds_t committed_at_millis{};
  fingerprint_t fingerprint;
  std::string identity_address;
};

using commitment_t = commitment<1>;

}  // namespace notary::schema
