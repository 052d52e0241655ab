#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger network the node and explorer links point at.
namespace notary::schema {

enum class network_t : uint8_t { testnet = 0, mainnet = 1, betanet = 2 };

inline constexpr auto kNetworkMappings = std::array{
    std::pair<std::string_view, network_t>{"testnet", network_t::testnet},
    std::pair<std::string_view, network_t>{"mainnet", network_t::mainnet},
    std::pair<std::string_view, network_t>{"betanet", network_t::betanet}};

template <>
inline std::optional<network_t> try_from_string<network_t>(
    const std::string_view value) {
  return from_string(value, kNetworkMappings);
}

inline constexpr std::string_view to_string(const network_t value) {
  return to_string(value, kNetworkMappings).value_or("unknown");
}

}  // namespace notary::schema
