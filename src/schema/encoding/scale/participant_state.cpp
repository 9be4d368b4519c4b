#include <titlebook/schema/encoding/scale/participant_state.hpp>

using namespace titlebook::schema;

namespace titlebook::schema::encoding::scale {

void encode(participant_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.first_name, encoder);
  encode(o.last_name, encoder);
  encode(o.assets, encoder);
}

void decode(participant_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.first_name, decoder);
  decode(o.last_name, decoder);
  decode(o.assets, decoder);
}

}  // namespace titlebook::schema::encoding::scale
