#pragma once

#include <notary/schema/account_info.hpp>
#include <notary/schema/node_status.hpp>
#include <notary/schema/transaction_info.hpp>
#include <notary/schema/transaction_params.hpp>

#include <optional>
#include <string>
#include <string_view>

// Parsers for algod v2 REST response bodies. Each returns nullopt when the
// body is not JSON or a required field is missing or mistyped.
namespace notary::rpc {

std::optional<notary::schema::node_status_t> parse_node_status(
    std::string_view body);

/// `first_valid` is the node's last round and `last_valid` is 1000 rounds
/// later.
std::optional<notary::schema::transaction_params_t> parse_transaction_params(
    std::string_view body);

std::optional<notary::schema::account_info_t> parse_account_info(
    std::string_view body);

std::optional<std::string> parse_submitted_transaction_id(
    std::string_view body);

std::optional<notary::schema::transaction_info_t> parse_transaction_info(
    std::string_view body);

/// The `message` field of an error body, or the body itself.
std::string parse_error_message(std::string_view body);

}  // namespace notary::rpc
