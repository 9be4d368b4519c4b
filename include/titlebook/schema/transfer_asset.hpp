#pragma once
#include <titlebook/schema/primitives.hpp>

// Schema type: transfer asset.
// Ownership workflow: move one asset from its current owner to another
// participant.
namespace titlebook::schema {

template <uint16_t Version>
struct transfer_asset;

template <>
struct transfer_asset<1> final {
  uint16_t version{1};
  participant_id_t transferer_id;
  participant_id_t transferee_id;
  asset_id_t asset_id;
};

using transfer_asset_t = transfer_asset<1>;

}  // namespace titlebook::schema
