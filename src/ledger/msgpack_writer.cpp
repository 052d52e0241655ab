#include <notary/ledger/msgpack_writer.hpp>

#include <iterator>
#include <limits>
#include <utility>

namespace notary::ledger {

void msgpack_writer::put_big_endian(const uint64_t value,
                                    const std::size_t width) {
  for (auto i = width; i > 0; --i) {
    out_.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFFu));
  }
}

void msgpack_writer::write_map_header(const std::size_t entries) {
  if (entries < 16) {
    out_.push_back(static_cast<uint8_t>(0x80u | entries));
  } else if (entries <= std::numeric_limits<uint16_t>::max()) {
    out_.push_back(0xde);
    put_big_endian(entries, 2);
  } else {
    out_.push_back(0xdf);
    put_big_endian(entries, 4);
  }
}

void msgpack_writer::write_string(const std::string_view value) {
  auto size = value.size();
  if (size < 32) {
    out_.push_back(static_cast<uint8_t>(0xa0u | size));
  } else if (size <= std::numeric_limits<uint8_t>::max()) {
    out_.push_back(0xd9);
    put_big_endian(size, 1);
  } else if (size <= std::numeric_limits<uint16_t>::max()) {
    out_.push_back(0xda);
    put_big_endian(size, 2);
  } else {
    out_.push_back(0xdb);
    put_big_endian(size, 4);
  }
  out_.insert(std::end(out_), std::begin(value), std::end(value));
}

void msgpack_writer::write_binary(const notary::schema::bytes_view_t& value) {
  auto size = value.size();
  if (size <= std::numeric_limits<uint8_t>::max()) {
    out_.push_back(0xc4);
    put_big_endian(size, 1);
  } else if (size <= std::numeric_limits<uint16_t>::max()) {
    out_.push_back(0xc5);
    put_big_endian(size, 2);
  } else {
    out_.push_back(0xc6);
    put_big_endian(size, 4);
  }
  out_.insert(std::end(out_), std::begin(value), std::end(value));
}

void msgpack_writer::write_unsigned(const uint64_t value) {
  if (value < 0x80) {
    out_.push_back(static_cast<uint8_t>(value));
  } else if (value <= std::numeric_limits<uint8_t>::max()) {
    out_.push_back(0xcc);
    put_big_endian(value, 1);
  } else if (value <= std::numeric_limits<uint16_t>::max()) {
    out_.push_back(0xcd);
    put_big_endian(value, 2);
  } else if (value <= std::numeric_limits<uint32_t>::max()) {
    out_.push_back(0xce);
    put_big_endian(value, 4);
  } else {
    out_.push_back(0xcf);
    put_big_endian(value, 8);
  }
}

void msgpack_writer::write_raw(const notary::schema::bytes_view_t& encoded) {
  out_.insert(std::end(out_), std::begin(encoded), std::end(encoded));
}

const notary::schema::bytes_t& msgpack_writer::bytes() const { return out_; }

notary::schema::bytes_t msgpack_writer::take() { return std::move(out_); }

}  // namespace notary::ledger
