#include <titlebook/schema/ledger_error_code.hpp>

namespace titlebook::schema {

std::string_view to_string(const ledger_error_code code) {
  using enum ledger_error_code;
  switch (code) {
    case argument_count_mismatch:
      return "argument_count_mismatch";
    case unknown_operation:
      return "unknown_operation";
    case invalid_argument:
      return "invalid_argument";
    case duplicate_key:
      return "duplicate_key";
    case unknown_owner:
      return "unknown_owner";
    case unknown_participant:
      return "unknown_participant";
    case unknown_asset:
      return "unknown_asset";
    case not_found:
      return "not_found";
    case not_owner:
      return "not_owner";
    case inconsistent_state:
      return "inconsistent_state";
  }
  return "unknown_error";
}

}  // namespace titlebook::schema
