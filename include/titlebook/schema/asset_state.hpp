#pragma once
#include <titlebook/schema/primitives.hpp>

// Schema type: asset state.
// Ownership workflow: an asset with exactly one current owner, referenced by
// participant id.
namespace titlebook::schema {

template <uint16_t Version>
struct asset_state;

template <>
struct asset_state<1> final {
  uint16_t version{1};
  asset_id_t id;
  asset_value_t value{};
  participant_id_t owner;
};

using asset_state_t = asset_state<1>;

}  // namespace titlebook::schema
