#pragma once
#include <titlebook/schema/primitives.hpp>

namespace titlebook::blake3 {

/// 32-byte BLAKE3 digest of bytes.
titlebook::schema::hash32_t hash(const titlebook::schema::bytes_view_t& bytes);

}  // namespace titlebook::blake3
