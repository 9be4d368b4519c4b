#include <spdlog/spdlog.h>
#include <array>
#include <initializer_list>
#include <iterator>
#include <titlebook/blake3/hash.hpp>
#include <titlebook/execution/engine.hpp>
#include <titlebook/execution/key_checker.hpp>
#include <titlebook/execution/operation_parser.hpp>
#include <titlebook/execution/repository.hpp>
#include <titlebook/execution/result.hpp>
#include <titlebook/execution/transfer.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace titlebook::schema;

namespace {

inline constexpr auto kCheckCodespace = "titlebook.check";
inline constexpr auto kInvokeCodespace = "titlebook.invoke";

struct seed_entry final {
  std::string_view participant_id;
  std::string_view first_name;
  std::string_view last_name;
  std::string_view asset_id;
  asset_value_t value;
};

inline constexpr auto kSeed = std::array{
    seed_entry{"owner1", "john", "doe", "asset1", 123},
    seed_entry{"owner2", "jane", "doe", "asset2", 456},
    seed_entry{"owner3", "jim", "doe", "asset3", 789},
};

hash32_t fold_state_root(
    titlebook::execution::encoder_t& encoder,
    const hash32_t& seed,
    const int64_t height,
    const std::vector<titlebook::storage::key_value_entry_t>& writes) {
  auto material = bytes_t{};
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  encoder.encode(height, material);
  for (const auto& [key, value] : writes) {
    encoder.encode(key, material);
    encoder.encode(value, material);
  }
  return titlebook::blake3::hash(bytes_view_t{material.data(), material.size()});
}

}  // namespace

namespace titlebook::execution {

engine::engine(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Ledger engine ready at height {}", last_committed_height_);
}

operation_result_t engine::check(const invocation_t& invocation) const {
  auto failure = operation_result_t{};
  if (!parse_operation(invocation, failure)) {
    failure.codespace = kCheckCodespace;
  }
  return failure;
}

operation_result_t engine::invoke(const invocation_t& invocation) {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("START: {} ({} argument(s))", invocation.function,
               invocation.args.size());

  auto result = operation_result_t{};
  auto operation = parse_operation(invocation, result);
  if (operation) {
    auto ctx = context{encoder_, storage_};
    result = execute_operation(*operation, ctx);
    if (result.code == 0 && !ctx.writes().empty()) {
      commit(ctx);
    }
  }

  if (result.code != 0) {
    result.codespace = kInvokeCodespace;
    spdlog::warn("FAILED: {} [{}] {}", invocation.function, result.log,
                 result.info);
  } else {
    spdlog::info("END: {}", invocation.function);
  }
  return result;
}

ledger_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = ledger_info_t{};
  result.height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

operation_result_t engine::execute_operation(const operation_t& operation,
                                             context& ctx) {
  auto records = repository{ctx};
  return std::visit(
      overloaded{
          [&](const init_ledger_t&) { return init_ledger(ctx); },
          [&](const query_state_t& request) {
            auto result = operation_result_t{};
            if (auto value = records.get(request.key, result)) {
              spdlog::debug("Query '{}' returned {} bytes", request.key,
                            value->size());
              result.data = std::move(*value);
            }
            return result;
          },
          [&](const create_participant_t& request) {
            return records.create_participant(request);
          },
          [&](const create_asset_t& request) {
            return records.create_asset(request);
          },
          [&](const transfer_asset_t& request) {
            return transfer_asset(records, request);
          }},
      operation);
}

operation_result_t engine::init_ledger(context& ctx) {
  for (const auto& entry : kSeed) {
    for (const auto key : {entry.participant_id, entry.asset_id}) {
      if (key_exists(ctx, key)) {
        return make_error(ledger_error_code::duplicate_key,
                          "ledger already initialized: key '" +
                              std::string{key} + "' exists");
      }
    }
  }

  auto participants = std::vector<participant_state_t>{};
  auto assets = std::vector<asset_state_t>{};
  for (const auto& entry : kSeed) {
    auto owner = participant_state_t{.id = std::string{entry.participant_id},
                                     .first_name = std::string{entry.first_name},
                                     .last_name = std::string{entry.last_name},
                                     .assets = {}};
    auto asset = asset_state_t{.id = std::string{entry.asset_id},
                               .value = entry.value,
                               .owner = owner.id};
    owner.assets.push_back(asset.id);
    participants.push_back(std::move(owner));
    assets.push_back(std::move(asset));
  }

  auto records = repository{ctx};
  for (const auto& participant : participants) {
    records.put(participant);
  }
  for (const auto& asset : assets) {
    records.put(asset);
  }
  return {};
}

void engine::commit(const context& ctx) {
  auto height = last_committed_height_ + 1;
  auto state_root = fold_state_root(encoder_, last_committed_state_root_,
                                    height, ctx.writes());
  storage_.commit(ctx.writes(), titlebook::storage::committed_state{
                                    .height = height, .state_root = state_root});
  last_committed_height_ = height;
  last_committed_state_root_ = state_root;
  spdlog::debug("Committed {} write(s) at height {} root {}",
                ctx.writes().size(), height,
                to_hex(bytes_view_t{state_root.data(), state_root.size()}));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger checkpoint");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    return;
  }
  last_committed_height_ = 0;
  last_committed_state_root_ = make_zero_hash();
  storage_.save_committed_state(titlebook::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
}

}  // namespace titlebook::execution
