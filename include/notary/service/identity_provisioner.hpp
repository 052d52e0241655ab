#pragma once

#include <notary/crypto/ed25519.hpp>
#include <notary/ledger/mnemonic.hpp>
#include <notary/schema/identity.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notary::service {

/// One way of producing a key pair. Returns nullopt or throws on failure.
struct identity_strategy final {
  std::string name;
  std::function<std::optional<notary::crypto::ed25519_key_pair>()> generate;
};

/// Key pair from the OpenSSL Ed25519 key generator.
identity_strategy make_keygen_strategy();
/// Random seed passed through the 25 word phrase and back. Fails without a
/// word list.
identity_strategy make_mnemonic_strategy(
    const notary::ledger::word_list* words);
/// Seed drawn from std::random_device instead of the OpenSSL generator.
identity_strategy make_random_device_strategy();
/// Seed hashed from the wall clock and the host's uname fields.
identity_strategy make_clock_platform_strategy();

/// Creates, restores and validates signing identities.
///
/// `generate` walks its strategies in order and returns the first identity
/// that validates. The mnemonic is attached whenever a word list is loaded.
class identity_provisioner final {
 public:
  /// Uses the four default strategies. `words` may be null and must outlive
  /// the provisioner.
  explicit identity_provisioner(
      const notary::ledger::word_list* words = nullptr);
  identity_provisioner(std::vector<identity_strategy> strategies,
                       const notary::ledger::word_list* words);

  /// Throws identity_generation_exhausted when every strategy fails.
  notary::schema::identity_t generate() const;

  /// Length, checksum and key consistency checks; no side effects.
  bool validate(const notary::schema::identity_t& candidate) const;

  /// Throws invalid_identity on an unusable phrase or when no word list is
  /// loaded.
  notary::schema::identity_t restore(std::string_view mnemonic) const;

  /// Accepts a 64 byte private key or a bare 32 byte seed. Throws
  /// invalid_identity otherwise.
  notary::schema::identity_t from_private_key(
      const notary::schema::bytes_view_t& private_key) const;

  /// Public key carried by a valid address.
  static std::optional<notary::schema::public_key_t> public_key_of(
      const notary::schema::identity_t& identity);
  static std::optional<notary::schema::ed25519_seed_t> seed_of(
      const notary::schema::identity_t& identity);

 private:
  notary::schema::identity_t make_identity(
      const notary::crypto::ed25519_key_pair& pair) const;

  std::vector<identity_strategy> strategies_;
  const notary::ledger::word_list* words_{nullptr};
};

}  // namespace notary::service
