#pragma once

#include <notary/schema/primitives.hpp>

#include <optional>

namespace notary::crypto {

struct ed25519_key_pair final {
  notary::schema::ed25519_seed_t seed{};
  notary::schema::public_key_t public_key{};
};

/// True when the OpenSSL provider in use supports Ed25519.
bool available();

std::optional<ed25519_key_pair> generate_ed25519();

std::optional<ed25519_key_pair> ed25519_from_seed(
    const notary::schema::ed25519_seed_t& seed);

std::optional<notary::schema::ed25519_signature_t> sign_ed25519(
    const notary::schema::bytes_view_t& message,
    const notary::schema::ed25519_seed_t& seed);

bool verify_ed25519(const notary::schema::bytes_view_t& message,
                    const notary::schema::public_key_t& public_key,
                    const notary::schema::ed25519_signature_t& signature);

}  // namespace notary::crypto
