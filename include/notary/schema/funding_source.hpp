#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: faucet endpoint consulted when an identity is underfunded.
namespace notary::schema {

enum class body_format_t : uint8_t { form = 0, json = 1 };

inline constexpr auto kBodyFormatMappings = std::array{
    std::pair<std::string_view, body_format_t>{"form", body_format_t::form},
    std::pair<std::string_view, body_format_t>{"json", body_format_t::json}};

template <>
inline std::optional<body_format_t> try_from_string<body_format_t>(
    const std::string_view value) {
  return from_string(value, kBodyFormatMappings);
}

inline constexpr std::string_view to_string(const body_format_t value) {
  return to_string(value, kBodyFormatMappings).value_or("unknown");
}

template <uint16_t Version>
struct funding_source;

template <>
struct funding_source<1> final {
  uint16_t version{1};
  std::string name;
  std::string url;
  body_format_t body_format{body_format_t::form};
};

using funding_source_t = funding_source<1>;

}  // namespace notary::schema
