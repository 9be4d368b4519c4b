#include <titlebook/execution/context.hpp>
#include <titlebook/execution/repository.hpp>
#include <titlebook/execution/transfer.hpp>
#include <titlebook/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using titlebook::schema::ledger_error_code;
using titlebook::testing::code_of;

void seed_pair(titlebook::testing::ledger_fixture& fixture) {
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "alice", .first_name = "alice", .last_name = "a",
      .assets = {"x"}});
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "bob", .first_name = "bob", .last_name = "b", .assets = {}});
  fixture.force_put(
      titlebook::schema::asset_state_t{.id = "x", .value = 5, .owner = "alice"});
}

titlebook::schema::operation_result_t run_transfer(
    titlebook::execution::context& ctx,
    const std::string& from,
    const std::string& to,
    const std::string& asset) {
  auto records = titlebook::execution::repository{ctx};
  return titlebook::execution::transfer_asset(
      records, titlebook::schema::transfer_asset_t{
                   .transferer_id = from, .transferee_id = to, .asset_id = asset});
}

}  // namespace

TEST(transfer, swaps_ownership_across_three_records) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_swap"};
  seed_pair(fixture);

  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  auto result = run_transfer(ctx, "alice", "bob", "x");
  ASSERT_EQ(result.code, 0u);

  ASSERT_EQ(ctx.writes().size(), 3u);
  EXPECT_EQ(ctx.writes()[0].first, titlebook::schema::make_bytes("alice"));
  EXPECT_EQ(ctx.writes()[1].first, titlebook::schema::make_bytes("bob"));
  EXPECT_EQ(ctx.writes()[2].first, titlebook::schema::make_bytes("x"));
  fixture.apply(ctx);

  EXPECT_TRUE(fixture.participant("alice")->assets.empty());
  auto bob = fixture.participant("bob");
  ASSERT_TRUE(bob.has_value());
  EXPECT_EQ(std::ranges::count(bob->assets, std::string{"x"}), 1);
  EXPECT_EQ(fixture.asset("x")->owner, "bob");
  EXPECT_EQ(fixture.asset("x")->value, 5u);
}

TEST(transfer, keeps_other_holdings_in_order) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_holdings"};
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "alice", .first_name = "alice", .last_name = "a",
      .assets = {"p", "x", "q"}});
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "bob", .first_name = "bob", .last_name = "b", .assets = {"r"}});
  fixture.force_put(
      titlebook::schema::asset_state_t{.id = "x", .value = 5, .owner = "alice"});

  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  ASSERT_EQ(run_transfer(ctx, "alice", "bob", "x").code, 0u);
  fixture.apply(ctx);

  EXPECT_EQ(fixture.participant("alice")->assets,
            (std::vector<std::string>{"p", "q"}));
  EXPECT_EQ(fixture.participant("bob")->assets,
            (std::vector<std::string>{"r", "x"}));
}

TEST(transfer, preconditions_are_checked_in_order) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_order"};
  seed_pair(fixture);
  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};

  auto missing_all = run_transfer(ctx, "nobody", "nobody2", "nothing");
  EXPECT_EQ(missing_all.code, code_of(ledger_error_code::unknown_participant));
  EXPECT_NE(missing_all.info.find("transferer"), std::string::npos);

  auto missing_transferee = run_transfer(ctx, "alice", "nobody", "x");
  EXPECT_EQ(missing_transferee.code,
            code_of(ledger_error_code::unknown_participant));
  EXPECT_NE(missing_transferee.info.find("transferee"), std::string::npos);

  auto missing_asset = run_transfer(ctx, "alice", "bob", "nothing");
  EXPECT_EQ(missing_asset.code, code_of(ledger_error_code::unknown_asset));

  auto asset_as_participant = run_transfer(ctx, "x", "bob", "x");
  EXPECT_EQ(asset_as_participant.code,
            code_of(ledger_error_code::unknown_participant));

  auto participant_as_asset = run_transfer(ctx, "alice", "bob", "bob");
  EXPECT_EQ(participant_as_asset.code,
            code_of(ledger_error_code::unknown_asset));

  EXPECT_TRUE(ctx.writes().empty());
}

TEST(transfer, non_owner_is_rejected_without_writes) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_owner"};
  seed_pair(fixture);
  auto before_alice = fixture.raw("alice");
  auto before_bob = fixture.raw("bob");
  auto before_x = fixture.raw("x");

  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  auto result = run_transfer(ctx, "bob", "alice", "x");
  EXPECT_EQ(result.code, code_of(ledger_error_code::not_owner));
  EXPECT_TRUE(ctx.writes().empty());
  EXPECT_EQ(fixture.raw("alice"), before_alice);
  EXPECT_EQ(fixture.raw("bob"), before_bob);
  EXPECT_EQ(fixture.raw("x"), before_x);
}

TEST(transfer, missing_holding_is_inconsistent_state) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_drift"};
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "alice", .first_name = "alice", .last_name = "a", .assets = {}});
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "bob", .first_name = "bob", .last_name = "b", .assets = {}});
  fixture.force_put(
      titlebook::schema::asset_state_t{.id = "x", .value = 5, .owner = "alice"});

  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  auto result = run_transfer(ctx, "alice", "bob", "x");
  EXPECT_EQ(result.code, code_of(ledger_error_code::inconsistent_state));
  EXPECT_TRUE(ctx.writes().empty());
}

TEST(transfer, duplicate_holding_is_inconsistent_state) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_twice"};
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "alice", .first_name = "alice", .last_name = "a",
      .assets = {"x"}});
  fixture.force_put(titlebook::schema::participant_state_t{
      .id = "bob", .first_name = "bob", .last_name = "b", .assets = {"x"}});
  fixture.force_put(
      titlebook::schema::asset_state_t{.id = "x", .value = 5, .owner = "alice"});

  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  auto result = run_transfer(ctx, "alice", "bob", "x");
  EXPECT_EQ(result.code, code_of(ledger_error_code::inconsistent_state));
  EXPECT_TRUE(ctx.writes().empty());
}

TEST(transfer, self_transfer_is_rejected) {
  auto fixture = titlebook::testing::ledger_fixture{"titlebook_transfer_self"};
  seed_pair(fixture);
  auto ctx = titlebook::execution::context{fixture.encoder(), fixture.storage()};
  auto result = run_transfer(ctx, "alice", "alice", "x");
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_argument));
  EXPECT_TRUE(ctx.writes().empty());
}
