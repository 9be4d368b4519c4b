#pragma once

#include <cstdint>
#include <string_view>

namespace titlebook::schema {

enum class ledger_error_code : uint32_t {
  argument_count_mismatch = 1,
  unknown_operation = 2,
  invalid_argument = 3,
  duplicate_key = 10,
  unknown_owner = 11,
  unknown_participant = 12,
  unknown_asset = 13,
  not_found = 14,
  not_owner = 15,
  inconsistent_state = 20,
};

std::string_view to_string(ledger_error_code code);

}  // namespace titlebook::schema
