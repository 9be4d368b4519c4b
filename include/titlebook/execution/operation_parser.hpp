#pragma once

#include <titlebook/schema/invocation.hpp>
#include <titlebook/schema/operation.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <optional>

namespace titlebook::execution {

/// Map an invocation onto its typed operation.
///
/// Unknown function names fail with unknown_operation, wrong argument counts
/// with argument_count_mismatch, a malformed new record id or asset value
/// with invalid_argument. On failure `failure` describes the rejection.
std::optional<titlebook::schema::operation_t> parse_operation(
    const titlebook::schema::invocation_t& invocation,
    titlebook::schema::operation_result_t& failure);

}  // namespace titlebook::execution
