#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct node_status;

template <>
struct node_status<1> final {
  uint16_t version{1};
  round_t last_round{};
  uint64_t time_since_last_round_ns{};
  uint64_t catchup_time_ns{};
};

using node_status_t = node_status<1>;

}  // namespace notary::schema
