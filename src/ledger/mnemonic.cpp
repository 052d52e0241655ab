#include <notary/crypto/digest.hpp>
#include <notary/ledger/mnemonic.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace notary::ledger {

namespace {

// Bytes are packed least significant bit first into 11 bit groups; a
// partial trailing group is emitted as is.
std::vector<uint16_t> to_uint11(const notary::schema::bytes_view_t& bytes) {
  auto out = std::vector<uint16_t>{};
  auto accumulator = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    accumulator |= static_cast<uint32_t>(byte) << bits;
    bits += 8;
    if (bits >= 11) {
      out.push_back(static_cast<uint16_t>(accumulator & 0x7FFu));
      accumulator >>= 11u;
      bits -= 11;
    }
  }
  if (bits > 0) {
    out.push_back(static_cast<uint16_t>(accumulator));
  }
  return out;
}

notary::schema::bytes_t from_uint11(const std::vector<uint16_t>& values) {
  auto out = notary::schema::bytes_t{};
  auto accumulator = uint32_t{0};
  auto bits = 0u;
  for (const auto value : values) {
    accumulator |= static_cast<uint32_t>(value) << bits;
    bits += 11;
    while (bits >= 8) {
      out.push_back(static_cast<uint8_t>(accumulator & 0xFFu));
      accumulator >>= 8u;
      bits -= 8;
    }
  }
  if (bits > 0) {
    out.push_back(static_cast<uint8_t>(accumulator));
  }
  return out;
}

uint16_t checksum_index(const notary::schema::ed25519_seed_t& seed) {
  auto digest = notary::crypto::sha512_256(seed);
  return to_uint11(notary::schema::bytes_view_t{digest.data(), 2}).front();
}

}  // namespace

word_list::word_list(std::vector<std::string> words)
    : words_{std::move(words)} {
  for (auto i = std::size_t{0}; i < words_.size(); ++i) {
    indexes_.emplace(words_[i], static_cast<uint16_t>(i));
  }
}

std::optional<word_list> word_list::load(const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::warn("word list '{}' could not be opened", path.string());
    return std::nullopt;
  }
  auto words = std::vector<std::string>{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    auto stream = std::istringstream{line};
    auto word = std::string{};
    if (stream >> word) {
      words.push_back(std::move(word));
    }
  }
  auto list = from_words(std::move(words));
  if (!list) {
    spdlog::warn("word list '{}' does not hold {} distinct words",
                 path.string(), kWordListSize);
  }
  return list;
}

std::optional<word_list> word_list::from_words(std::vector<std::string> words) {
  if (words.size() != kWordListSize) {
    return std::nullopt;
  }
  auto list = word_list{std::move(words)};
  if (list.indexes_.size() != kWordListSize) {
    return std::nullopt;
  }
  return list;
}

const std::string& word_list::word(const uint16_t index) const {
  return words_.at(index);
}

std::optional<uint16_t> word_list::index_of(const std::string_view word) const {
  auto it = indexes_.find(std::string{word});
  if (it == std::end(indexes_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t word_list::size() const { return words_.size(); }

std::string seed_to_mnemonic(const notary::schema::ed25519_seed_t& seed,
                             const word_list& words) {
  auto out = std::string{};
  for (const auto index : to_uint11(seed)) {
    out += words.word(index);
    out.push_back(' ');
  }
  out += words.word(checksum_index(seed));
  return out;
}

std::optional<notary::schema::ed25519_seed_t> mnemonic_to_seed(
    const std::string_view mnemonic,
    const word_list& words) {
  auto stream = std::istringstream{std::string{mnemonic}};
  auto indexes = std::vector<uint16_t>{};
  auto word = std::string{};
  while (stream >> word) {
    auto index = words.index_of(word);
    if (!index) {
      return std::nullopt;
    }
    indexes.push_back(*index);
  }
  if (indexes.size() != kMnemonicWords) {
    return std::nullopt;
  }

  auto checksum = indexes.back();
  indexes.pop_back();
  auto bytes = from_uint11(indexes);
  // 24 words carry 264 bits: 256 bits of seed and a zero byte.
  if (bytes.size() != 33 || bytes.back() != 0) {
    return std::nullopt;
  }

  auto seed = notary::schema::ed25519_seed_t{};
  std::copy_n(std::begin(bytes), seed.size(), std::begin(seed));
  if (checksum_index(seed) != checksum) {
    return std::nullopt;
  }
  return seed;
}

}  // namespace notary::ledger
