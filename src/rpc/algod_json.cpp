#include <notary/ledger/transaction.hpp>
#include <notary/rpc/algod_json.hpp>

#include <json/json.h>

#include <memory>

namespace notary::rpc {

namespace {

std::optional<Json::Value> parse_object(const std::string_view body) {
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto root = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) ||
      !root.isObject()) {
    return std::nullopt;
  }
  return root;
}

std::optional<uint64_t> unsigned_field(const Json::Value& object,
                                       const char* name) {
  if (!object.isMember(name) || !object[name].isUInt64()) {
    return std::nullopt;
  }
  return object[name].asUInt64();
}

std::optional<std::string> string_field(const Json::Value& object,
                                        const char* name) {
  if (!object.isObject() || !object.isMember(name) ||
      !object[name].isString()) {
    return std::nullopt;
  }
  return object[name].asString();
}

}  // namespace

std::optional<notary::schema::node_status_t> parse_node_status(
    const std::string_view body) {
  auto root = parse_object(body);
  if (!root) {
    return std::nullopt;
  }
  auto last_round = unsigned_field(*root, "last-round");
  if (!last_round) {
    return std::nullopt;
  }
  auto status = notary::schema::node_status_t{};
  status.last_round = *last_round;
  status.time_since_last_round_ns =
      unsigned_field(*root, "time-since-last-round").value_or(0);
  status.catchup_time_ns = unsigned_field(*root, "catchup-time").value_or(0);
  return status;
}

std::optional<notary::schema::transaction_params_t> parse_transaction_params(
    const std::string_view body) {
  auto root = parse_object(body);
  if (!root) {
    return std::nullopt;
  }
  auto fee = unsigned_field(*root, "fee");
  auto min_fee = unsigned_field(*root, "min-fee");
  auto last_round = unsigned_field(*root, "last-round");
  auto genesis_id = string_field(*root, "genesis-id");
  auto genesis_hash_text = string_field(*root, "genesis-hash");
  if (!fee || !min_fee || !last_round || !genesis_id || !genesis_hash_text) {
    return std::nullopt;
  }
  auto genesis_hash_bytes =
      notary::schema::try_from_base64(*genesis_hash_text);
  if (!genesis_hash_bytes) {
    return std::nullopt;
  }
  auto genesis_hash = notary::schema::try_make_hash32(*genesis_hash_bytes);
  if (!genesis_hash) {
    return std::nullopt;
  }

  auto params = notary::schema::transaction_params_t{};
  params.fee_per_byte = *fee;
  params.min_fee = *min_fee;
  params.first_valid = *last_round;
  params.last_valid = *last_round + notary::ledger::kValidityWindow;
  params.genesis_id = *genesis_id;
  params.genesis_hash = *genesis_hash;
  return params;
}

std::optional<notary::schema::account_info_t> parse_account_info(
    const std::string_view body) {
  auto root = parse_object(body);
  if (!root) {
    return std::nullopt;
  }
  auto amount = unsigned_field(*root, "amount");
  if (!amount) {
    return std::nullopt;
  }
  auto info = notary::schema::account_info_t{};
  info.address = string_field(*root, "address").value_or("");
  info.amount = *amount;
  return info;
}

std::optional<std::string> parse_submitted_transaction_id(
    const std::string_view body) {
  auto root = parse_object(body);
  if (!root) {
    return std::nullopt;
  }
  return string_field(*root, "txId");
}

std::optional<notary::schema::transaction_info_t> parse_transaction_info(
    const std::string_view body) {
  auto root = parse_object(body);
  if (!root) {
    return std::nullopt;
  }

  auto info = notary::schema::transaction_info_t{};
  if (auto round = unsigned_field(*root, "confirmed-round");
      round.has_value() && *round > 0) {
    info.confirmed_round = *round;
  }
  info.pool_error = string_field(*root, "pool-error").value_or("");

  const auto& object = *root;
  const auto& txn = object["txn"];
  if (txn.isObject()) {
    info.signed_note = string_field(txn["txn"], "note");
    info.flat_note = string_field(txn, "note");
  }
  info.transaction_note = string_field(object["transaction"], "note");
  return info;
}

std::string parse_error_message(const std::string_view body) {
  if (auto root = parse_object(body)) {
    if (auto message = string_field(*root, "message")) {
      return *message;
    }
  }
  return std::string{body};
}

}  // namespace notary::rpc
