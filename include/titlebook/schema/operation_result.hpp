#pragma once

#include <titlebook/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace titlebook::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
};

using operation_result_t = operation_result<1>;

}  // namespace titlebook::schema
