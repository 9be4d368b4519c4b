#pragma once
#include <titlebook/schema/primitives.hpp>

namespace titlebook::schema {

template <uint16_t Version>
struct create_participant;

template <>
struct create_participant<1> final {
  uint16_t version{1};
  participant_id_t participant_id;
  std::string first_name;
  std::string last_name;
};

using create_participant_t = create_participant<1>;

}  // namespace titlebook::schema
