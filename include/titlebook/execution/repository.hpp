#pragma once

#include <titlebook/execution/context.hpp>
#include <titlebook/schema/create_asset.hpp>
#include <titlebook/schema/create_participant.hpp>
#include <titlebook/schema/ledger_error_code.hpp>
#include <titlebook/schema/ledger_record.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <optional>
#include <string_view>

namespace titlebook::execution {

/// Participant and asset records keyed by id over an invocation context.
///
/// Records are stored as an encoded `ledger_record_t`. Getters report failures
/// through `failure`, leaving it untouched on success.
class repository final {
 public:
  explicit repository(context& ctx);

  /// Write a new participant with empty holdings.
  ///
  /// Fails with duplicate_key when the id already holds a value.
  titlebook::schema::operation_result_t create_participant(
      const titlebook::schema::create_participant_t& request);

  /// Write a new asset and append it to its owner's holdings.
  ///
  /// Fails with duplicate_key when the id already holds a value and with
  /// unknown_owner when the owner id does not hold a participant.
  titlebook::schema::operation_result_t create_asset(
      const titlebook::schema::create_asset_t& request);

  /// Stored bytes at key; not_found when the key holds nothing.
  std::optional<titlebook::schema::bytes_t> get(
      std::string_view key,
      titlebook::schema::operation_result_t& failure) const;

  /// Decoded record at key; not_found when absent, inconsistent_state when the
  /// stored bytes do not decode.
  std::optional<titlebook::schema::ledger_record_t> get_record(
      std::string_view key,
      titlebook::schema::operation_result_t& failure) const;

  /// Participant at key. Absent keys and keys holding another record kind fail
  /// with `missing`.
  std::optional<titlebook::schema::participant_state_t> get_participant(
      std::string_view key,
      titlebook::schema::ledger_error_code missing,
      titlebook::schema::operation_result_t& failure) const;

  /// Asset at key. Absent keys and keys holding another record kind fail with
  /// `missing`.
  std::optional<titlebook::schema::asset_state_t> get_asset(
      std::string_view key,
      titlebook::schema::ledger_error_code missing,
      titlebook::schema::operation_result_t& failure) const;

  /// Encode and write under the record's id, overwriting.
  void put(const titlebook::schema::participant_state_t& participant);
  void put(const titlebook::schema::asset_state_t& asset);

 private:
  void put_record(const titlebook::schema::ledger_record_t& record);

  context& ctx_;
};

}  // namespace titlebook::execution
