#pragma once
#include <cstdint>

// Schema type: init ledger.
// Ownership workflow: fixed seed of three participants each holding one asset.
namespace titlebook::schema {

template <uint16_t Version>
struct init_ledger;

template <>
struct init_ledger<1> final {
  uint16_t version{1};
};

using init_ledger_t = init_ledger<1>;

}  // namespace titlebook::schema
