#include <spdlog/spdlog.h>
#include <titlebook/execution/key_checker.hpp>
#include <titlebook/execution/repository.hpp>
#include <titlebook/execution/result.hpp>
#include <algorithm>
#include <string>

using namespace titlebook::schema;

namespace titlebook::execution {

repository::repository(context& ctx) : ctx_{ctx} {}

operation_result_t repository::create_participant(
    const create_participant_t& request) {
  if (key_exists(ctx_, request.participant_id)) {
    return make_error(ledger_error_code::duplicate_key,
                      "key '" + request.participant_id +
                          "' is not unique, try again with a unique id");
  }

  put(participant_state_t{.id = request.participant_id,
                          .first_name = request.first_name,
                          .last_name = request.last_name,
                          .assets = {}});
  return {};
}

operation_result_t repository::create_asset(const create_asset_t& request) {
  if (key_exists(ctx_, request.asset_id)) {
    return make_error(ledger_error_code::duplicate_key,
                      "key '" + request.asset_id +
                          "' is not unique, try again with a unique id");
  }

  auto failure = operation_result_t{};
  auto owner = get_participant(request.owner_id,
                               ledger_error_code::unknown_owner, failure);
  if (!owner) {
    return failure;
  }
  if (std::ranges::find(owner->assets, request.asset_id) !=
      std::end(owner->assets)) {
    spdlog::critical("Participant '{}' lists asset '{}' that does not exist",
                     owner->id, request.asset_id);
    return make_error(ledger_error_code::inconsistent_state,
                      "participant '" + owner->id + "' already lists asset '" +
                          request.asset_id + "' which has no record");
  }

  owner->assets.push_back(request.asset_id);
  put(asset_state_t{
      .id = request.asset_id, .value = request.value, .owner = owner->id});
  put(*owner);
  return {};
}

std::optional<bytes_t> repository::get(std::string_view key,
                                       operation_result_t& failure) const {
  if (!key_exists(ctx_, key)) {
    failure = make_error(ledger_error_code::not_found,
                         "key '" + std::string{key} + "' does not exist");
    return std::nullopt;
  }
  return ctx_.get_state(key);
}

std::optional<ledger_record_t> repository::get_record(
    std::string_view key,
    operation_result_t& failure) const {
  auto raw = get(key, failure);
  if (!raw) {
    return std::nullopt;
  }
  auto record = ctx_.encoder().try_decode<ledger_record_t>(
      bytes_view_t{raw->data(), raw->size()});
  if (!record) {
    spdlog::critical("Stored value at '{}' is not a ledger record", key);
    failure = make_error(
        ledger_error_code::inconsistent_state,
        "stored value at '" + std::string{key} + "' is not a ledger record");
    return std::nullopt;
  }
  return record;
}

std::optional<participant_state_t> repository::get_participant(
    std::string_view key,
    const ledger_error_code missing,
    operation_result_t& failure) const {
  auto lookup = operation_result_t{};
  auto record = get_record(key, lookup);
  if (!record) {
    failure = is_error(lookup, ledger_error_code::not_found)
                  ? make_error(missing, "participant '" + std::string{key} +
                                            "' does not exist")
                  : lookup;
    return std::nullopt;
  }
  if (auto* participant = std::get_if<participant_state_t>(&*record)) {
    return std::move(*participant);
  }
  failure = make_error(missing,
                       "key '" + std::string{key} + "' is not a participant");
  return std::nullopt;
}

std::optional<asset_state_t> repository::get_asset(
    std::string_view key,
    const ledger_error_code missing,
    operation_result_t& failure) const {
  auto lookup = operation_result_t{};
  auto record = get_record(key, lookup);
  if (!record) {
    failure = is_error(lookup, ledger_error_code::not_found)
                  ? make_error(missing, "asset '" + std::string{key} +
                                            "' does not exist")
                  : lookup;
    return std::nullopt;
  }
  if (auto* asset = std::get_if<asset_state_t>(&*record)) {
    return std::move(*asset);
  }
  failure =
      make_error(missing, "key '" + std::string{key} + "' is not an asset");
  return std::nullopt;
}

void repository::put(const participant_state_t& participant) {
  put_record(ledger_record_t{participant});
}

void repository::put(const asset_state_t& asset) {
  put_record(ledger_record_t{asset});
}

void repository::put_record(const ledger_record_t& record) {
  ctx_.put_state(id_of(record), ctx_.encoder().encode(record));
}

}  // namespace titlebook::execution
