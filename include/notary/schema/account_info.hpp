#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace notary::schema {

template <uint16_t Version>
struct account_info;

template <>
struct account_info<1> final {
  uint16_t version{1};
  std::string address;
  microalgos_t amount{};
};

using account_info_t = account_info<1>;

}  // namespace notary::schema
