#pragma once

#include <notary/schema/commitment.hpp>
#include <scale/scale.hpp>

namespace notary::schema::encoding::scale {

void encode(notary::schema::commitment<1>&& o, ::scale::Encoder& encoder);
void decode(notary::schema::commitment<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
