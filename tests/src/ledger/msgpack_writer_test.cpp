#include <gtest/gtest.h>
#include <notary/ledger/msgpack_writer.hpp>

#include <string>

TEST(ledger_msgpack, selects_shortest_unsigned_encoding) {
  auto writer = notary::ledger::msgpack_writer{};
  writer.write_unsigned(0x7f);
  writer.write_unsigned(0x80);
  writer.write_unsigned(0x100);
  writer.write_unsigned(0x10000);
  writer.write_unsigned(0x100000000ull);
  EXPECT_EQ(writer.bytes(),
            (notary::schema::bytes_t{0x7f, 0xcc, 0x80, 0xcd, 0x01, 0x00,
                                     0xce, 0x00, 0x01, 0x00, 0x00, 0xcf,
                                     0x00, 0x00, 0x00, 0x01, 0x00, 0x00,
                                     0x00, 0x00}));
}

TEST(ledger_msgpack, encodes_strings_by_length) {
  auto writer = notary::ledger::msgpack_writer{};
  writer.write_string("fee");
  EXPECT_EQ(writer.bytes(), (notary::schema::bytes_t{0xa3, 'f', 'e', 'e'}));

  auto long_writer = notary::ledger::msgpack_writer{};
  long_writer.write_string(std::string(32, 'x'));
  ASSERT_EQ(long_writer.bytes().size(), 34u);
  EXPECT_EQ(long_writer.bytes()[0], 0xd9);
  EXPECT_EQ(long_writer.bytes()[1], 32);
}

TEST(ledger_msgpack, encodes_binary_and_map_headers) {
  auto writer = notary::ledger::msgpack_writer{};
  writer.write_map_header(2);
  writer.write_binary(notary::schema::bytes_t{0x01, 0x02});
  writer.write_map_header(16);
  EXPECT_EQ(writer.take(), (notary::schema::bytes_t{0x82, 0xc4, 0x02, 0x01,
                                                     0x02, 0xde, 0x00, 0x10}));
}
