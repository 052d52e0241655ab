#pragma once

#include <notary/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace notary::ledger {

/// Minimal MessagePack writer for the canonical transaction encoding.
///
/// Always selects the shortest representation for integers, strings, binary
/// blobs and map headers. Map keys must be written by the caller in sorted
/// order and empty values skipped.
class msgpack_writer final {
 public:
  void write_map_header(std::size_t entries);
  void write_string(std::string_view value);
  void write_binary(const notary::schema::bytes_view_t& value);
  void write_unsigned(uint64_t value);
  /// Append an already encoded value.
  void write_raw(const notary::schema::bytes_view_t& encoded);

  const notary::schema::bytes_t& bytes() const;
  notary::schema::bytes_t take();

 private:
  void put_big_endian(uint64_t value, std::size_t width);

  notary::schema::bytes_t out_;
};

}  // namespace notary::ledger
