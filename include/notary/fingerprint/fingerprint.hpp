#pragma once

#include <notary/schema/enum_string.hpp>
#include <notary/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace notary::fingerprint {

enum class digest_algorithm_t : uint8_t { sha256 = 0, blake3 = 1 };

inline constexpr auto kDigestAlgorithmMappings = std::array{
    std::pair<std::string_view, digest_algorithm_t>{"sha256",
                                                    digest_algorithm_t::sha256},
    std::pair<std::string_view, digest_algorithm_t>{
        "blake3", digest_algorithm_t::blake3}};

inline constexpr std::string_view to_string(const digest_algorithm_t value) {
  return notary::schema::to_string(value, kDigestAlgorithmMappings)
      .value_or("unknown");
}

/// Compact JSON with object keys sorted at every depth. nullopt when `json`
/// does not parse.
std::optional<std::string> canonical_json(std::string_view json);

/// Lowercase hex digest of the canonical form of a JSON record. Throws
/// std::invalid_argument when `record_json` does not parse.
notary::schema::fingerprint_t compute(
    std::string_view record_json,
    digest_algorithm_t algorithm = digest_algorithm_t::sha256);

/// 64 lowercase hex characters.
bool is_well_formed(std::string_view fingerprint);

}  // namespace notary::fingerprint

namespace notary::schema {

template <>
inline std::optional<notary::fingerprint::digest_algorithm_t>
try_from_string<notary::fingerprint::digest_algorithm_t>(
    const std::string_view value) {
  return from_string(value, notary::fingerprint::kDigestAlgorithmMappings);
}

}  // namespace notary::schema
