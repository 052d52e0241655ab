#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace notary::schema {

enum class commitment_error_code_t : uint8_t {
  insufficient_funds = 0,
  network_error = 1,
  node_rejected = 2,
  confirmation_timeout = 3,
  cancelled = 4,
  encoding_failed = 5
};

inline constexpr auto kCommitmentErrorCodeMappings =
    std::array{std::pair<std::string_view, commitment_error_code_t>{
                   "insufficient_funds",
                   commitment_error_code_t::insufficient_funds},
               std::pair<std::string_view, commitment_error_code_t>{
                   "network_error", commitment_error_code_t::network_error},
               std::pair<std::string_view, commitment_error_code_t>{
                   "node_rejected", commitment_error_code_t::node_rejected},
               std::pair<std::string_view, commitment_error_code_t>{
                   "confirmation_timeout",
                   commitment_error_code_t::confirmation_timeout},
               std::pair<std::string_view, commitment_error_code_t>{
                   "cancelled", commitment_error_code_t::cancelled},
               std::pair<std::string_view, commitment_error_code_t>{
                   "encoding_failed",
                   commitment_error_code_t::encoding_failed}};

template <>
inline std::optional<commitment_error_code_t>
try_from_string<commitment_error_code_t>(const std::string_view value) {
  return from_string(value, kCommitmentErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const commitment_error_code_t value) {
  return to_string(value, kCommitmentErrorCodeMappings).value_or("unknown");
}

}  // namespace notary::schema
