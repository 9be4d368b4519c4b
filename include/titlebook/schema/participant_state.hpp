#pragma once
#include <titlebook/schema/primitives.hpp>
#include <vector>

// Schema type: participant state.
// Ownership workflow: a party that holds zero or more assets. Holdings are
// asset ids in acquisition order.
namespace titlebook::schema {

template <uint16_t Version>
struct participant_state;

template <>
struct participant_state<1> final {
  uint16_t version{1};
  participant_id_t id;
  std::string first_name;
  std::string last_name;
  std::vector<asset_id_t> assets;
};

using participant_state_t = participant_state<1>;

}  // namespace titlebook::schema
