#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace notary::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

/// Parse a user supplied enum name, throwing std::invalid_argument with the
/// accepted names when it is unknown.
template <typename Enum, std::size_t N>
Enum parse_enum(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  if (auto parsed = from_string(value, mappings)) {
    return *parsed;
  }
  auto accepted = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!accepted.empty()) {
      accepted += ", ";
    }
    accepted += name;
  }
  throw std::invalid_argument{"unknown value '" + std::string{value} +
                              "', expected one of: " + accepted};
}

}  // namespace notary::schema
