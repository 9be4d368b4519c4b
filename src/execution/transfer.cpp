#include <spdlog/spdlog.h>
#include <titlebook/execution/result.hpp>
#include <titlebook/execution/transfer.hpp>
#include <algorithm>
#include <iterator>

using namespace titlebook::schema;

namespace titlebook::execution {

operation_result_t transfer_asset(repository& records,
                                  const transfer_asset_t& request) {
  auto failure = operation_result_t{};

  auto transferer = records.get_participant(
      request.transferer_id, ledger_error_code::unknown_participant, failure);
  if (!transferer) {
    if (is_error(failure, ledger_error_code::unknown_participant)) {
      failure.info = "transferer " + failure.info;
    }
    return failure;
  }

  auto transferee = records.get_participant(
      request.transferee_id, ledger_error_code::unknown_participant, failure);
  if (!transferee) {
    if (is_error(failure, ledger_error_code::unknown_participant)) {
      failure.info = "transferee " + failure.info;
    }
    return failure;
  }

  auto asset = records.get_asset(request.asset_id,
                                 ledger_error_code::unknown_asset, failure);
  if (!asset) {
    return failure;
  }

  if (asset->owner != transferer->id) {
    return make_error(ledger_error_code::not_owner,
                      "participant '" + transferer->id +
                          "' does not own asset '" + asset->id + "'");
  }

  if (transferer->id == transferee->id) {
    return make_error(ledger_error_code::invalid_argument,
                      "asset '" + asset->id +
                          "' cannot be transferred to its current owner");
  }

  auto held = std::ranges::find(transferer->assets, asset->id);
  if (held == std::end(transferer->assets)) {
    spdlog::critical(
        "Asset '{}' names '{}' as owner but is missing from its holdings",
        asset->id, transferer->id);
    return make_error(ledger_error_code::inconsistent_state,
                      "asset '" + asset->id + "' does not exist in '" +
                          transferer->id + "' holdings");
  }
  if (std::ranges::find(transferee->assets, asset->id) !=
      std::end(transferee->assets)) {
    spdlog::critical("Asset '{}' owned by '{}' is also held by '{}'",
                     asset->id, transferer->id, transferee->id);
    return make_error(ledger_error_code::inconsistent_state,
                      "asset '" + asset->id + "' already exists in '" +
                          transferee->id + "' holdings");
  }

  spdlog::info("Transferring asset '{}' from '{}' to '{}'", asset->id,
               transferer->id, transferee->id);
  transferer->assets.erase(held);
  transferee->assets.push_back(asset->id);
  asset->owner = transferee->id;

  records.put(*transferer);
  records.put(*transferee);
  records.put(*asset);
  return {};
}

}  // namespace titlebook::execution
