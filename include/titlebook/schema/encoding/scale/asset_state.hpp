#pragma once
#include <titlebook/schema/asset_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace titlebook::schema::encoding::scale {

void encode(titlebook::schema::asset_state<1>&& o, ::scale::Encoder& encoder);
void decode(titlebook::schema::asset_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace titlebook::schema::encoding::scale
