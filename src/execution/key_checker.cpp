#include <titlebook/execution/key_checker.hpp>

namespace titlebook::execution {

bool key_exists(const context& ctx, std::string_view key) {
  if (key_violation(key)) {
    return false;
  }
  auto value = ctx.get_state(key);
  return value.has_value() && !value->empty();
}

std::optional<std::string> key_violation(std::string_view key) {
  if (key.empty()) {
    return std::string{"key must not be empty"};
  }
  if (key.starts_with(titlebook::schema::kReservedKeyPrefix)) {
    return "key '" + std::string{key} + "' uses the reserved prefix '" +
           std::string{titlebook::schema::kReservedKeyPrefix} + "'";
  }
  return std::nullopt;
}

}  // namespace titlebook::execution
