#include <blake3.h>
#include <notary/blake3/hash.hpp>

namespace notary::blake3 {

notary::schema::hash32_t hash(const std::string_view& str) {
  return hash(notary::schema::make_bytes_view(str));
}

notary::schema::hash32_t hash(const notary::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = notary::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace notary::blake3
