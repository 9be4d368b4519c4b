#pragma once
#include <titlebook/common/critical.hpp>
#include <titlebook/schema/encoding/encoder.hpp>
#include <titlebook/schema/encoding/scale/asset_state.hpp>
#include <titlebook/schema/encoding/scale/participant_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace titlebook::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  titlebook::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, titlebook::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const titlebook::schema::bytes_view_t& bytes);
};

template <typename T>
titlebook::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    titlebook::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        titlebook::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const titlebook::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace titlebook::schema::encoding
