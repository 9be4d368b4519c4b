#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace titlebook::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using participant_id_t = std::string;
using asset_id_t = std::string;
using asset_value_t = uint64_t;

/// Keys beginning with this prefix belong to the host, never to records.
inline constexpr auto kReservedKeyPrefix = std::string_view{"SYS|"};

/// Key text as raw bytes, as handed to the store.
bytes_view_t make_bytes_view(std::string_view text);
bytes_t make_bytes(std::string_view text);

std::string to_hex(const bytes_view_t& bytes);
hash32_t make_zero_hash();

}  // namespace titlebook::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
