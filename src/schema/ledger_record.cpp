#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <titlebook/schema/ledger_record.hpp>

namespace titlebook::schema {

record_kind kind_of(const ledger_record_t& record) {
  return std::visit(
      overloaded{
          [](const participant_state_t&) { return record_kind::participant; },
          [](const asset_state_t&) { return record_kind::asset; }},
      record);
}

const std::string& id_of(const ledger_record_t& record) {
  return std::visit(
      [](const auto& value) -> const std::string& { return value.id; },
      record);
}

std::string describe(const participant_state_t& participant) {
  return fmt::format("participant id={} first_name={} last_name={} assets=[{}]",
                     participant.id, participant.first_name,
                     participant.last_name,
                     fmt::join(participant.assets, ", "));
}

std::string describe(const asset_state_t& asset) {
  return fmt::format("asset id={} value={} owner={}", asset.id, asset.value,
                     asset.owner);
}

std::string describe(const ledger_record_t& record) {
  return std::visit([](const auto& value) { return describe(value); }, record);
}

}  // namespace titlebook::schema
