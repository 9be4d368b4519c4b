#pragma once
#include <titlebook/schema/primitives.hpp>
#include <optional>
#include <span>

namespace titlebook::schema::encoding {

// The codec is a build time choice: callers name the library through a tag
// type and never touch the library API directly.
template <typename Library>
struct encoder {
  template <typename T>
  titlebook::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, titlebook::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const titlebook::schema::bytes_view_t& bytes);
};

}  // namespace titlebook::schema::encoding
