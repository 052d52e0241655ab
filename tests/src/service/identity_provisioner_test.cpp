#include <gtest/gtest.h>
#include <notary/crypto/ed25519.hpp>
#include <notary/ledger/address.hpp>
#include <notary/service/errors.hpp>
#include <notary/service/identity_provisioner.hpp>
#include <notary/testing/common.hpp>

#include <optional>
#include <stdexcept>
#include <vector>

namespace {

notary::service::identity_strategy make_failing_strategy(const bool throws) {
  return {"failing",
          [throws]() -> std::optional<notary::crypto::ed25519_key_pair> {
            if (throws) {
              throw std::runtime_error{"strategy unavailable"};
            }
            return std::nullopt;
          }};
}

notary::service::identity_strategy make_fixed_strategy(const uint8_t seed) {
  return {"fixed", [seed] {
            return notary::crypto::ed25519_from_seed(
                notary::testing::make_seed(seed));
          }};
}

}  // namespace

TEST(identity_provisioner, generates_valid_identities) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto provisioner = notary::service::identity_provisioner{};
  auto identity = provisioner.generate();
  EXPECT_EQ(identity.address.size(), notary::schema::kAddressLength);
  EXPECT_EQ(identity.private_key.size(), notary::schema::kPrivateKeyLength);
  EXPECT_FALSE(identity.mnemonic.has_value());
  EXPECT_TRUE(provisioner.validate(identity));
  EXPECT_NE(provisioner.generate().address, identity.address);
}

TEST(identity_provisioner, falls_through_failing_strategies) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto provisioner = notary::service::identity_provisioner{
      {make_failing_strategy(true), make_failing_strategy(false),
       make_fixed_strategy(9)},
      nullptr};
  auto identity = provisioner.generate();
  EXPECT_EQ(identity.address, notary::testing::make_identity(9).address);
}

TEST(identity_provisioner, throws_when_every_strategy_fails) {
  auto provisioner = notary::service::identity_provisioner{
      {make_failing_strategy(true), make_failing_strategy(false),
       notary::service::make_mnemonic_strategy(nullptr)},
      nullptr};
  EXPECT_THROW(static_cast<void>(provisioner.generate()),
               notary::service::identity_generation_exhausted);
}

TEST(identity_provisioner, validate_rejects_malformed_identities) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto provisioner = notary::service::identity_provisioner{};
  auto identity = notary::testing::make_identity(1);
  ASSERT_TRUE(provisioner.validate(identity));

  auto short_address = identity;
  short_address.address.pop_back();
  EXPECT_FALSE(provisioner.validate(short_address));

  auto bad_checksum = identity;
  bad_checksum.address[0] = bad_checksum.address[0] == 'A' ? 'B' : 'A';
  EXPECT_FALSE(provisioner.validate(bad_checksum));

  auto short_key = identity;
  short_key.private_key.resize(32);
  EXPECT_FALSE(provisioner.validate(short_key));

  auto foreign_key = identity;
  foreign_key.private_key = notary::testing::make_identity(2).private_key;
  EXPECT_FALSE(provisioner.validate(foreign_key));

  // validate leaves its input untouched
  EXPECT_EQ(identity.address, notary::testing::make_identity(1).address);
}

TEST(identity_provisioner, attaches_and_restores_mnemonics) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto words = notary::testing::make_word_list();
  auto provisioner = notary::service::identity_provisioner{&words};
  auto identity = provisioner.generate();
  ASSERT_TRUE(identity.mnemonic.has_value());

  auto restored = provisioner.restore(*identity.mnemonic);
  EXPECT_EQ(restored.address, identity.address);
  EXPECT_EQ(restored.private_key, identity.private_key);

  EXPECT_THROW(static_cast<void>(provisioner.restore("w0001 w0002")),
               notary::service::invalid_identity);
  auto without_words = notary::service::identity_provisioner{};
  EXPECT_THROW(static_cast<void>(without_words.restore(*identity.mnemonic)),
               notary::service::invalid_identity);
}

TEST(identity_provisioner, imports_private_keys) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto provisioner = notary::service::identity_provisioner{};
  auto expected = notary::testing::make_identity(4);

  auto full = provisioner.from_private_key(expected.private_key);
  EXPECT_EQ(full.address, expected.address);

  auto seed = notary::schema::bytes_t{std::begin(expected.private_key),
                                      std::begin(expected.private_key) + 32};
  EXPECT_EQ(provisioner.from_private_key(seed).address, expected.address);

  auto mismatched = expected.private_key;
  mismatched[40] ^= 0xFFu;
  EXPECT_THROW(static_cast<void>(provisioner.from_private_key(mismatched)),
               notary::service::invalid_identity);
  EXPECT_THROW(static_cast<void>(provisioner.from_private_key(
                   notary::schema::bytes_t(16, 1))),
               notary::service::invalid_identity);
}
