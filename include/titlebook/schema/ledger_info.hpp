#pragma once
#include <titlebook/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger info.
// Latest committed checkpoint: number of committed mutating invocations and
// the state root folded over their write sets.
namespace titlebook::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t version{1};
  int64_t height{};
  hash32_t state_root{};
};

using ledger_info_t = ledger_info<1>;

}  // namespace titlebook::schema
