#include <notary/schema/primitives.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace notary::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

bool is_base64_char(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' ||
         c == '/';
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return {};
  }
  auto out = std::string(((bytes.size() + 2) / 3) * 4, '\0');
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                      bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(std::max(written, 0)));
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });

  if (compact.empty()) {
    return bytes_t{};
  }
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock accepts '=' anywhere and reports padded lengths, so the
  // padding is validated and subtracted here.
  auto padding = size_t{0};
  while (padding < 2 && compact[compact.size() - 1 - padding] == '=') {
    ++padding;
  }
  auto body = std::string_view{compact}.substr(0, compact.size() - padding);
  if (!std::all_of(std::begin(body), std::end(body), is_base64_char)) {
    return std::nullopt;
  }

  auto out = bytes_t((compact.size() / 4) * 3);
  auto written = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
      static_cast<int>(compact.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

}  // namespace notary::schema
