#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <titlebook/schema/primitives.hpp>

namespace titlebook::schema {

bytes_view_t make_bytes_view(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

bytes_t make_bytes(std::string_view text) {
  auto view = make_bytes_view(text);
  return bytes_t(view.begin(), view.end());
}

std::string to_hex(const bytes_view_t& bytes) {
  return fmt::format("{:02x}", fmt::join(bytes, ""));
}

hash32_t make_zero_hash() {
  return {};
}

}  // namespace titlebook::schema
