#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: suggested transaction parameters reported by the node.
namespace notary::schema {

template <uint16_t Version>
struct transaction_params;

template <>
struct transaction_params<1> final {
  uint16_t version{1};
  microalgos_t fee_per_byte{};
  microalgos_t min_fee{1000};
  round_t first_valid{};
  round_t last_valid{};
  std::string genesis_id;
  hash32_t genesis_hash{};
};

using transaction_params_t = transaction_params<1>;

}  // namespace notary::schema
