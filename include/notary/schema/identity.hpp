#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: signing identity.
// `private_key` is the 32 byte Ed25519 seed followed by the 32 byte public
// key; `address` is the checksummed ledger encoding of that public key.
namespace notary::schema {

inline constexpr auto kAddressLength = std::size_t{58};
inline constexpr auto kPrivateKeyLength = std::size_t{64};

template <uint16_t Version>
struct identity;

template <>
struct identity<1> final {
  uint16_t version{1};
  std::string address;
  bytes_t private_key;
  std::optional<std::string> mnemonic;
};

using identity_t = identity<1>;

}  // namespace notary::schema
