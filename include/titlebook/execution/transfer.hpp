#pragma once

#include <titlebook/execution/repository.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <titlebook/schema/transfer_asset.hpp>

namespace titlebook::execution {

/// Move an asset from its current owner to another participant.
///
/// Checks, in order: transferer exists (unknown_participant), transferee
/// exists (unknown_participant), asset exists (unknown_asset), transferer owns
/// the asset (not_owner). The transferer's holdings must list the asset and
/// the transferee's must not (inconsistent_state). Nothing is written unless
/// every check passes; then transferer, transferee and asset are written in
/// that order.
titlebook::schema::operation_result_t transfer_asset(
    repository& records,
    const titlebook::schema::transfer_asset_t& request);

}  // namespace titlebook::execution
