#pragma once
#include <titlebook/schema/participant_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace titlebook::schema::encoding::scale {

void encode(titlebook::schema::participant_state<1>&& o,
            ::scale::Encoder& encoder);
void decode(titlebook::schema::participant_state<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace titlebook::schema::encoding::scale
