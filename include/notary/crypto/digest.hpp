#pragma once

#include <notary/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace notary::crypto {

notary::schema::hash32_t sha256(const notary::schema::bytes_view_t& bytes);
notary::schema::hash32_t sha256(const std::string_view& str);

/// SHA-512 truncated to 256 bits (FIPS 180-4), the ledger's address checksum
/// and transaction id hash.
notary::schema::hash32_t sha512_256(const notary::schema::bytes_view_t& bytes);

/// Bytes from the OpenSSL CSPRNG, nullopt when it is not seeded.
std::optional<notary::schema::bytes_t> random_bytes(std::size_t size);

}  // namespace notary::crypto
