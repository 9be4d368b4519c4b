#pragma once
#include <titlebook/schema/primitives.hpp>

// Schema type: query state.
// Ownership workflow: read the stored bytes under a single key.
namespace titlebook::schema {

template <uint16_t Version>
struct query_state;

template <>
struct query_state<1> final {
  uint16_t version{1};
  std::string key;
};

using query_state_t = query_state<1>;

}  // namespace titlebook::schema
