#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace notary::ledger {

inline constexpr auto kWordListSize = std::size_t{2048};
inline constexpr auto kMnemonicWords = std::size_t{25};

/// The 2048 word dictionary used by 25 word backup phrases, indexed by 11 bit
/// value.
class word_list final {
 public:
  /// One word per line; blank lines are ignored. nullopt unless exactly 2048
  /// distinct words are present.
  static std::optional<word_list> load(const std::filesystem::path& path);
  static std::optional<word_list> from_words(std::vector<std::string> words);

  const std::string& word(uint16_t index) const;
  std::optional<uint16_t> index_of(std::string_view word) const;
  std::size_t size() const;

 private:
  explicit word_list(std::vector<std::string> words);

  std::vector<std::string> words_;
  std::unordered_map<std::string, uint16_t> indexes_;
};

/// 24 words carrying the seed followed by a checksum word taken from
/// SHA-512/256(seed).
std::string seed_to_mnemonic(const notary::schema::ed25519_seed_t& seed,
                             const word_list& words);

/// nullopt on a wrong word count, an unknown word, non-zero padding or a
/// checksum mismatch.
std::optional<notary::schema::ed25519_seed_t> mnemonic_to_seed(
    std::string_view mnemonic,
    const word_list& words);

}  // namespace notary::ledger
