#include <titlebook/execution/key_checker.hpp>
#include <titlebook/execution/operation_parser.hpp>
#include <titlebook/execution/result.hpp>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

using namespace titlebook::schema;

namespace {

inline constexpr auto kInitLedger = std::string_view{"initLedger"};
inline constexpr auto kQuery = std::string_view{"query"};
inline constexpr auto kCreateParticipant =
    std::string_view{"createParticipant"};
inline constexpr auto kCreateAsset = std::string_view{"createAsset"};
inline constexpr auto kTransferAsset = std::string_view{"transferAsset"};

bool expect_arguments(const invocation_t& invocation,
                      const std::size_t expected,
                      operation_result_t& failure) {
  if (invocation.args.size() == expected) {
    return true;
  }
  failure = titlebook::execution::make_error(
      ledger_error_code::argument_count_mismatch,
      "incorrect number of arguments for '" + invocation.function +
          "'. Expecting " + std::to_string(expected) + ", got " +
          std::to_string(invocation.args.size()));
  return false;
}

// Only ids about to be created are held to the key rules. Lookups of a
// malformed key simply find nothing.
bool expect_key(std::string_view key, operation_result_t& failure) {
  if (auto violation = titlebook::execution::key_violation(key)) {
    failure = titlebook::execution::make_error(
        ledger_error_code::invalid_argument, *violation);
    return false;
  }
  return true;
}

std::optional<asset_value_t> parse_value(std::string_view text) {
  auto value = asset_value_t{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

namespace titlebook::execution {

std::optional<operation_t> parse_operation(const invocation_t& invocation,
                                           operation_result_t& failure) {
  const auto& function = invocation.function;
  const auto& args = invocation.args;

  if (function == kInitLedger) {
    if (!expect_arguments(invocation, 0, failure)) {
      return std::nullopt;
    }
    return operation_t{init_ledger_t{}};
  }

  if (function == kQuery) {
    if (!expect_arguments(invocation, 1, failure)) {
      return std::nullopt;
    }
    return operation_t{query_state_t{.key = args[0]}};
  }

  if (function == kCreateParticipant) {
    if (!expect_arguments(invocation, 3, failure) ||
        !expect_key(args[0], failure)) {
      return std::nullopt;
    }
    return operation_t{create_participant_t{
        .participant_id = args[0], .first_name = args[1], .last_name = args[2]}};
  }

  if (function == kCreateAsset) {
    if (!expect_arguments(invocation, 3, failure) ||
        !expect_key(args[0], failure)) {
      return std::nullopt;
    }
    auto value = parse_value(args[1]);
    if (!value) {
      failure = make_error(ledger_error_code::invalid_argument,
                           "asset value '" + args[1] +
                               "' is not an unsigned integer");
      return std::nullopt;
    }
    return operation_t{create_asset_t{
        .asset_id = args[0], .value = *value, .owner_id = args[2]}};
  }

  if (function == kTransferAsset) {
    if (!expect_arguments(invocation, 3, failure)) {
      return std::nullopt;
    }
    return operation_t{transfer_asset_t{.transferer_id = args[0],
                                        .transferee_id = args[1],
                                        .asset_id = args[2]}};
  }

  failure = make_error(ledger_error_code::unknown_operation,
                       "received unknown function '" + function +
                           "' invocation");
  return std::nullopt;
}

}  // namespace titlebook::execution
