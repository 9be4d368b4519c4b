#pragma once
#include <titlebook/schema/asset_state.hpp>
#include <titlebook/schema/participant_state.hpp>
#include <string>
#include <variant>

namespace titlebook::schema {

/// Stored value under a record key. The variant index is encoded first, so a
/// stored value names its own kind.
using ledger_record_t = std::variant<participant_state_t, asset_state_t>;

enum class record_kind : uint8_t {
  participant = 0,
  asset = 1,
};

record_kind kind_of(const ledger_record_t& record);
const std::string& id_of(const ledger_record_t& record);

/// One-line human readable rendering used by logs and the CLI.
std::string describe(const participant_state_t& participant);
std::string describe(const asset_state_t& asset);
std::string describe(const ledger_record_t& record);

}  // namespace titlebook::schema
