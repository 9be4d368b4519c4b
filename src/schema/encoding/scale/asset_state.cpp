#include <titlebook/schema/encoding/scale/asset_state.hpp>

using namespace titlebook::schema;

namespace titlebook::schema::encoding::scale {

void encode(asset_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.value, encoder);
  encode(o.owner, encoder);
}

void decode(asset_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.value, decoder);
  decode(o.owner, decoder);
}

}  // namespace titlebook::schema::encoding::scale
