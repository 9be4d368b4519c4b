#pragma once
#include <titlebook/schema/primitives.hpp>

namespace titlebook::schema {

template <uint16_t Version>
struct create_asset;

template <>
struct create_asset<1> final {
  uint16_t version{1};
  asset_id_t asset_id;
  asset_value_t value{};
  participant_id_t owner_id;
};

using create_asset_t = create_asset<1>;

}  // namespace titlebook::schema
