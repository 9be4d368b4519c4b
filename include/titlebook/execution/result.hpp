#pragma once

#include <titlebook/schema/ledger_error_code.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <string>
#include <utility>

namespace titlebook::execution {

inline titlebook::schema::operation_result_t make_error(
    const titlebook::schema::ledger_error_code code,
    std::string info) {
  auto result = titlebook::schema::operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{titlebook::schema::to_string(code)};
  result.info = std::move(info);
  return result;
}

inline bool is_error(const titlebook::schema::operation_result_t& result,
                     const titlebook::schema::ledger_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace titlebook::execution
