#pragma once
#include <titlebook/schema/create_asset.hpp>
#include <titlebook/schema/create_participant.hpp>
#include <titlebook/schema/init_ledger.hpp>
#include <titlebook/schema/query_state.hpp>
#include <titlebook/schema/transfer_asset.hpp>
#include <variant>

namespace titlebook::schema {

using operation_t = std::variant<init_ledger_t,
                                 query_state_t,
                                 create_participant_t,
                                 create_asset_t,
                                 transfer_asset_t>;

}  // namespace titlebook::schema
