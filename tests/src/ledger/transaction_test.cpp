#include <gtest/gtest.h>
#include <notary/crypto/ed25519.hpp>
#include <notary/ledger/address.hpp>
#include <notary/ledger/transaction.hpp>
#include <notary/testing/common.hpp>

#include <algorithm>
#include <string>

namespace {

notary::schema::transaction_params_t make_params(
    const notary::schema::microalgos_t fee_per_byte) {
  auto params = notary::schema::transaction_params_t{};
  params.fee_per_byte = fee_per_byte;
  params.min_fee = 1000;
  params.first_valid = 5000;
  params.last_valid = 6000;
  params.genesis_id = "testnet-v1.0";
  params.genesis_hash.fill(0x42);
  return params;
}

bool contains(const notary::schema::bytes_t& haystack,
              const std::string_view needle) {
  auto view = notary::schema::make_string_view(haystack);
  return view.find(needle) != std::string_view::npos;
}

}  // namespace

TEST(ledger_transaction, self_payment_uses_minimum_fee_and_window) {
  auto account = notary::schema::public_key_t{};
  account.fill(0x07);
  auto transaction = notary::ledger::make_self_payment(
      account, make_params(0), notary::schema::bytes_t{'h', 'i'});

  EXPECT_EQ(transaction.sender, account);
  EXPECT_EQ(transaction.receiver, account);
  EXPECT_EQ(transaction.amount, 0u);
  EXPECT_EQ(transaction.fee, 1000u);
  EXPECT_EQ(transaction.first_valid, 5000u);
  EXPECT_EQ(transaction.last_valid, 6000u);
}

TEST(ledger_transaction, self_payment_fee_scales_with_size) {
  auto account = notary::schema::public_key_t{};
  account.fill(0x07);
  auto note = notary::schema::bytes_t(200, 'n');
  auto transaction =
      notary::ledger::make_self_payment(account, make_params(10), note);

  auto estimate = transaction;
  estimate.fee = 10;
  auto expected = 10 * (notary::ledger::encode_transaction(estimate).size() +
                        notary::ledger::kSignatureOverhead);
  EXPECT_EQ(transaction.fee, std::max<uint64_t>(1000, expected));
  EXPECT_GT(transaction.fee, 1000u);
}

TEST(ledger_transaction, encoding_sorts_keys_and_omits_zero_amount) {
  auto account = notary::schema::public_key_t{};
  account.fill(0x07);
  auto transaction = notary::ledger::make_self_payment(
      account, make_params(0), notary::schema::bytes_t{'h', 'i'});
  auto encoded = notary::ledger::encode_transaction(transaction);

  // fee fv gen gh lv note rcv snd type
  ASSERT_FALSE(encoded.empty());
  EXPECT_EQ(encoded[0], 0x89);
  EXPECT_FALSE(contains(encoded, "amt"));
  auto text = notary::schema::make_string_view(encoded);
  EXPECT_LT(text.find("fee"), text.find("fv"));
  EXPECT_LT(text.find("gen"), text.find("gh"));
  EXPECT_LT(text.find("note"), text.find("rcv"));
  EXPECT_LT(text.find("snd"), text.find("type"));
  EXPECT_TRUE(contains(encoded, "pay"));

  auto payload = notary::ledger::signing_payload(transaction);
  EXPECT_EQ(notary::schema::make_string_view(payload).substr(0, 2), "TX");
  EXPECT_EQ(payload.size(), encoded.size() + 2);
}

TEST(ledger_transaction, transaction_id_is_52_base32_characters) {
  auto account = notary::schema::public_key_t{};
  account.fill(0x07);
  auto transaction = notary::ledger::make_self_payment(
      account, make_params(0), notary::schema::bytes_t{'h', 'i'});
  auto id = notary::ledger::transaction_id(transaction);
  EXPECT_EQ(id.size(), 52u);
  EXPECT_TRUE(notary::ledger::try_base32_decode(id).has_value());

  transaction.note.push_back('!');
  EXPECT_NE(notary::ledger::transaction_id(transaction), id);
}

TEST(ledger_transaction, signed_form_carries_verifiable_signature) {
  if (!notary::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto pair = notary::crypto::ed25519_from_seed(notary::testing::make_seed(1));
  ASSERT_TRUE(pair.has_value());
  auto transaction = notary::ledger::make_self_payment(
      pair->public_key, make_params(0), notary::schema::bytes_t{'h', 'i'});

  auto signed_bytes = notary::ledger::sign_transaction(transaction, pair->seed);
  ASSERT_TRUE(signed_bytes.has_value());
  auto encoded = notary::ledger::encode_transaction(transaction);
  ASSERT_EQ(signed_bytes->size(), 75u + encoded.size());
  EXPECT_EQ((*signed_bytes)[0], 0x82);
  EXPECT_EQ(notary::schema::make_string_view(*signed_bytes).substr(2, 3),
            "sig");
  EXPECT_EQ(notary::schema::make_string_view(*signed_bytes).substr(72, 3),
            "txn");

  auto signature = notary::schema::ed25519_signature_t{};
  std::copy_n(std::begin(*signed_bytes) + 7, signature.size(),
              std::begin(signature));
  EXPECT_TRUE(notary::crypto::verify_ed25519(
      notary::ledger::signing_payload(transaction), pair->public_key,
      signature));
  EXPECT_TRUE(std::equal(std::begin(encoded), std::end(encoded),
                         std::begin(*signed_bytes) + 75));
}
