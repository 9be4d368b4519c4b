#pragma once

#include <titlebook/execution/context.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace titlebook::execution {

/// True when a non-empty value is stored at key. Never mutates state.
///
/// Keys that could never name a record (empty, reserved prefix) are absent
/// and are not looked up.
bool key_exists(const context& ctx, std::string_view key);

/// Reason key cannot name a record, or std::nullopt when it can.
///
/// Record keys are non-empty and stay out of the reserved `SYS|` keyspace.
std::optional<std::string> key_violation(std::string_view key);

}  // namespace titlebook::execution
