#include <blake3.h>
#include <titlebook/blake3/hash.hpp>
#include <tuple>

namespace titlebook::blake3 {

static_assert(BLAKE3_OUT_LEN ==
              std::tuple_size_v<titlebook::schema::hash32_t>);

titlebook::schema::hash32_t hash(const titlebook::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto digest = titlebook::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace titlebook::blake3
