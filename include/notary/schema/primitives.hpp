#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notary::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using public_key_t = std::array<uint8_t, 32>;
using ed25519_seed_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;
using fingerprint_t = std::string;
using microalgos_t = uint64_t;
using round_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Standard alphabet with padding (RFC 4648 section 4).
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);

}  // namespace notary::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
