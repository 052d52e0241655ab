#include <notary/crypto/digest.hpp>
#include <notary/ledger/address.hpp>
#include <notary/schema/identity.hpp>

#include <algorithm>
#include <iterator>

namespace notary::ledger {

namespace {

constexpr auto kAlphabet = std::string_view{"ABCDEFGHIJKLMNOPQRSTUVWXYZ234567"};

std::optional<uint8_t> base32_value(const char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<uint8_t>(c - 'A');
  }
  if (c >= '2' && c <= '7') {
    return static_cast<uint8_t>(c - '2' + 26);
  }
  return std::nullopt;
}

std::array<uint8_t, kChecksumLength> checksum(
    const notary::schema::public_key_t& public_key) {
  auto digest = notary::crypto::sha512_256(public_key);
  auto out = std::array<uint8_t, kChecksumLength>{};
  std::copy(std::end(digest) - kChecksumLength, std::end(digest),
            std::begin(out));
  return out;
}

}  // namespace

std::string base32_encode(const notary::schema::bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() * 8) + 4) / 5);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    buffer = (buffer << 8u) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(kAlphabet[(buffer >> (bits - 5)) & 0x1Fu]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1Fu]);
  }
  return out;
}

std::optional<notary::schema::bytes_t> try_base32_decode(
    const std::string_view encoded) {
  auto out = notary::schema::bytes_t{};
  out.reserve((encoded.size() * 5) / 8);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto c : encoded) {
    auto value = base32_value(c);
    if (!value) {
      return std::nullopt;
    }
    buffer = (buffer << 5u) | *value;
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFFu));
      bits -= 8;
    }
  }
  // A full base32 character left over, or leftover bits that are set, can
  // only come from a non canonical encoding.
  if (bits >= 5 || (buffer & ((1u << bits) - 1u)) != 0) {
    return std::nullopt;
  }
  return out;
}

std::string encode_address(const notary::schema::public_key_t& public_key) {
  auto raw = notary::schema::bytes_t{std::begin(public_key),
                                     std::end(public_key)};
  auto sum = checksum(public_key);
  raw.insert(std::end(raw), std::begin(sum), std::end(sum));
  return base32_encode(raw);
}

std::optional<notary::schema::public_key_t> try_decode_address(
    const std::string_view address) {
  if (address.size() != notary::schema::kAddressLength) {
    return std::nullopt;
  }
  auto raw = try_base32_decode(address);
  if (!raw || raw->size() != 32 + kChecksumLength) {
    return std::nullopt;
  }
  auto public_key = notary::schema::public_key_t{};
  std::copy_n(std::begin(*raw), public_key.size(), std::begin(public_key));
  auto expected = checksum(public_key);
  if (!std::equal(std::begin(expected), std::end(expected),
                  std::begin(*raw) + public_key.size())) {
    return std::nullopt;
  }
  return public_key;
}

bool is_valid_address(const std::string_view address) {
  return try_decode_address(address).has_value();
}

}  // namespace notary::ledger
