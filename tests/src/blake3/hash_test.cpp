#include <gtest/gtest.h>
#include <notary/blake3/hash.hpp>

#include <string_view>

TEST(blake3_hash, hashes_empty_input) {
  auto digest = notary::blake3::hash(std::string_view{});
  EXPECT_EQ(notary::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, string_and_byte_overloads_agree) {
  auto text = std::string_view{"notary"};
  EXPECT_EQ(notary::blake3::hash(text),
            notary::blake3::hash(notary::schema::make_bytes_view(text)));
}
