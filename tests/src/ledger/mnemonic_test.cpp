#include <gtest/gtest.h>
#include <notary/ledger/mnemonic.hpp>
#include <notary/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split(const std::string& phrase) {
  auto stream = std::istringstream{phrase};
  auto words = std::vector<std::string>{};
  auto word = std::string{};
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

std::string join(const std::vector<std::string>& words) {
  auto out = std::string{};
  for (const auto& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}

}  // namespace

TEST(ledger_mnemonic, round_trips_seed_through_25_words) {
  auto words = notary::testing::make_word_list();
  auto seed = notary::testing::make_seed(0x11);
  auto phrase = notary::ledger::seed_to_mnemonic(seed, words);
  EXPECT_EQ(split(phrase).size(), notary::ledger::kMnemonicWords);

  auto restored = notary::ledger::mnemonic_to_seed(phrase, words);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, seed);
}

TEST(ledger_mnemonic, rejects_wrong_checksum_word) {
  auto words = notary::testing::make_word_list();
  auto phrase = split(notary::ledger::seed_to_mnemonic(
      notary::testing::make_seed(0x22), words));
  auto checksum = *words.index_of(phrase.back());
  phrase.back() = words.word(static_cast<uint16_t>((checksum + 1) % 2048));
  EXPECT_FALSE(notary::ledger::mnemonic_to_seed(join(phrase), words));
}

TEST(ledger_mnemonic, rejects_non_zero_padding_and_unknown_words) {
  auto words = notary::testing::make_word_list();
  auto phrase = split(notary::ledger::seed_to_mnemonic(
      notary::testing::make_seed(0x33), words));

  auto padded = phrase;
  padded[23] = "w2047";
  EXPECT_FALSE(notary::ledger::mnemonic_to_seed(join(padded), words));

  auto unknown = phrase;
  unknown[0] = "zebra";
  EXPECT_FALSE(notary::ledger::mnemonic_to_seed(join(unknown), words));

  phrase.pop_back();
  EXPECT_FALSE(notary::ledger::mnemonic_to_seed(join(phrase), words));
}

TEST(ledger_mnemonic, word_list_requires_2048_distinct_words) {
  auto words = notary::testing::make_synthetic_words();
  auto short_list = words;
  short_list.pop_back();
  EXPECT_FALSE(notary::ledger::word_list::from_words(short_list));

  auto duplicated = words;
  duplicated[1] = duplicated[0];
  EXPECT_FALSE(notary::ledger::word_list::from_words(duplicated));

  auto list = notary::ledger::word_list::from_words(words);
  ASSERT_TRUE(list.has_value());
  EXPECT_EQ(list->index_of("w0042"), uint16_t{42});
  EXPECT_FALSE(list->index_of("w9999"));
}

TEST(ledger_mnemonic, loads_word_list_from_file) {
  auto path = notary::testing::make_db_path("notary_words");
  {
    auto out = std::ofstream{path};
    for (const auto& word : notary::testing::make_synthetic_words()) {
      out << word << "\n\n";
    }
  }
  auto list = notary::ledger::word_list::load(path);
  ASSERT_TRUE(list.has_value());
  EXPECT_EQ(list->size(), notary::ledger::kWordListSize);
  EXPECT_EQ(list->word(2047), "w2047");
  notary::testing::remove_path(path);

  EXPECT_FALSE(notary::ledger::word_list::load(path));
}
