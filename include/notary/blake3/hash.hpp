#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace notary::blake3 {

notary::schema::hash32_t hash(const std::string_view& str);
notary::schema::hash32_t hash(const notary::schema::bytes_view_t& bytes);

}  // namespace notary::blake3
