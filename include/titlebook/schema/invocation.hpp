#pragma once
#include <titlebook/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: invocation.
// Request envelope handed to the engine: a function name and its positional
// string arguments.
namespace titlebook::schema {

template <uint16_t Version>
struct invocation;

template <>
struct invocation<1> final {
  uint16_t version{1};
  std::string function;
  std::vector<std::string> args;
};

using invocation_t = invocation<1>;

}  // namespace titlebook::schema
