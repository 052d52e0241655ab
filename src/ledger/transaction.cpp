#include <notary/crypto/digest.hpp>
#include <notary/crypto/ed25519.hpp>
#include <notary/ledger/address.hpp>
#include <notary/ledger/msgpack_writer.hpp>
#include <notary/ledger/transaction.hpp>

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace notary::ledger {

namespace {

constexpr auto kTransactionType = std::string_view{"pay"};
constexpr auto kDomainSeparator = std::string_view{"TX"};

template <typename T>
bool is_zero(const T& value) {
  return std::all_of(std::begin(value), std::end(value),
                     [](const uint8_t byte) { return byte == 0; });
}

}  // namespace

payment_transaction_t make_self_payment(
    const notary::schema::public_key_t& account,
    const notary::schema::transaction_params_t& params,
    notary::schema::bytes_t note) {
  auto transaction = payment_transaction_t{};
  transaction.sender = account;
  transaction.receiver = account;
  transaction.amount = 0;
  transaction.first_valid = params.first_valid;
  transaction.last_valid = params.first_valid + kValidityWindow;
  transaction.genesis_id = params.genesis_id;
  transaction.genesis_hash = params.genesis_hash;
  transaction.note = std::move(note);

  transaction.fee = params.fee_per_byte;
  auto estimated_size =
      encode_transaction(transaction).size() + kSignatureOverhead;
  transaction.fee =
      std::max(params.min_fee,
               params.fee_per_byte *
                   static_cast<notary::schema::microalgos_t>(estimated_size));
  return transaction;
}

notary::schema::bytes_t encode_transaction(
    const payment_transaction_t& transaction) {
  auto has_amount = transaction.amount != 0;
  auto has_fee = transaction.fee != 0;
  auto has_first_valid = transaction.first_valid != 0;
  auto has_genesis_id = !transaction.genesis_id.empty();
  auto has_genesis_hash = !is_zero(transaction.genesis_hash);
  auto has_last_valid = transaction.last_valid != 0;
  auto has_note = !transaction.note.empty();
  auto has_receiver = !is_zero(transaction.receiver);
  auto has_sender = !is_zero(transaction.sender);

  auto entries = std::size_t{1};
  for (const auto present :
       {has_amount, has_fee, has_first_valid, has_genesis_id, has_genesis_hash,
        has_last_valid, has_note, has_receiver, has_sender}) {
    entries += present ? 1 : 0;
  }

  auto writer = msgpack_writer{};
  writer.write_map_header(entries);
  if (has_amount) {
    writer.write_string("amt");
    writer.write_unsigned(transaction.amount);
  }
  if (has_fee) {
    writer.write_string("fee");
    writer.write_unsigned(transaction.fee);
  }
  if (has_first_valid) {
    writer.write_string("fv");
    writer.write_unsigned(transaction.first_valid);
  }
  if (has_genesis_id) {
    writer.write_string("gen");
    writer.write_string(transaction.genesis_id);
  }
  if (has_genesis_hash) {
    writer.write_string("gh");
    writer.write_binary(transaction.genesis_hash);
  }
  if (has_last_valid) {
    writer.write_string("lv");
    writer.write_unsigned(transaction.last_valid);
  }
  if (has_note) {
    writer.write_string("note");
    writer.write_binary(transaction.note);
  }
  if (has_receiver) {
    writer.write_string("rcv");
    writer.write_binary(transaction.receiver);
  }
  if (has_sender) {
    writer.write_string("snd");
    writer.write_binary(transaction.sender);
  }
  writer.write_string("type");
  writer.write_string(kTransactionType);
  return writer.take();
}

notary::schema::bytes_t signing_payload(
    const payment_transaction_t& transaction) {
  auto payload = notary::schema::make_bytes(kDomainSeparator);
  auto encoded = encode_transaction(transaction);
  payload.insert(std::end(payload), std::begin(encoded), std::end(encoded));
  return payload;
}

std::string transaction_id(const payment_transaction_t& transaction) {
  auto digest = notary::crypto::sha512_256(signing_payload(transaction));
  return base32_encode(digest);
}

std::optional<notary::schema::bytes_t> sign_transaction(
    const payment_transaction_t& transaction,
    const notary::schema::ed25519_seed_t& seed) {
  auto signature =
      notary::crypto::sign_ed25519(signing_payload(transaction), seed);
  if (!signature) {
    return std::nullopt;
  }
  auto writer = msgpack_writer{};
  writer.write_map_header(2);
  writer.write_string("sig");
  writer.write_binary(*signature);
  writer.write_string("txn");
  writer.write_raw(encode_transaction(transaction));
  return writer.take();
}

}  // namespace notary::ledger
