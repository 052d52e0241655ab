#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace notary::schema {

template <uint16_t Version>
struct note_metadata;

template <>
struct note_metadata<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t created_at_millis{};
  std::string format_version{"1.0"};
  std::string application{"HealthGuardian"};
};

using note_metadata_t = note_metadata<1>;

}  // namespace notary::schema
