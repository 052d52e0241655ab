#pragma once

#include <notary/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace notary::ledger {

inline constexpr auto kChecksumLength = std::size_t{4};

/// RFC 4648 base32 without padding.
std::string base32_encode(const notary::schema::bytes_view_t& bytes);

/// Inverse of base32_encode. Rejects lowercase input, impossible lengths and
/// non-zero trailing bits so that every byte string has exactly one encoding.
std::optional<notary::schema::bytes_t> try_base32_decode(
    std::string_view encoded);

/// public key followed by the last four bytes of SHA-512/256(public key),
/// base32 encoded to 58 characters.
std::string encode_address(const notary::schema::public_key_t& public_key);

std::optional<notary::schema::public_key_t> try_decode_address(
    std::string_view address);

bool is_valid_address(std::string_view address);

}  // namespace notary::ledger
