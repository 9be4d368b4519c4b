#include <titlebook/schema/encoding/scale/encoder.hpp>
#include <titlebook/schema/invocation.hpp>
#include <titlebook/schema/ledger_record.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <gtest/gtest.h>

#include <string>
#include <variant>

namespace {

using encoder_t = titlebook::schema::encoding::encoder<
    titlebook::schema::encoding::scale_encoder_tag>;

titlebook::schema::participant_state_t make_participant() {
  return titlebook::schema::participant_state_t{
      .id = "owner1",
      .first_name = "john",
      .last_name = "doe",
      .assets = {"asset1", "asset7"}};
}

}  // namespace

TEST(encoding_types, defaults_are_stable) {
  auto participant = titlebook::schema::participant_state_t{};
  EXPECT_EQ(participant.version, 1u);
  EXPECT_TRUE(participant.assets.empty());

  auto asset = titlebook::schema::asset_state_t{};
  EXPECT_EQ(asset.version, 1u);
  EXPECT_EQ(asset.value, 0u);

  auto result = titlebook::schema::operation_result_t{};
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(result.data.empty());

  auto invocation = titlebook::schema::invocation_t{};
  EXPECT_TRUE(invocation.function.empty());
  EXPECT_TRUE(invocation.args.empty());
}

TEST(encoding_types, participant_record_keeps_every_field) {
  auto encoder = encoder_t{};
  auto participant = make_participant();
  auto encoded =
      encoder.encode(titlebook::schema::ledger_record_t{participant});

  auto decoded = encoder.try_decode<titlebook::schema::ledger_record_t>(
      titlebook::schema::bytes_view_t{encoded.data(), encoded.size()});
  ASSERT_TRUE(decoded.has_value());
  ASSERT_TRUE(
      std::holds_alternative<titlebook::schema::participant_state_t>(*decoded));
  const auto& out = std::get<titlebook::schema::participant_state_t>(*decoded);
  EXPECT_EQ(out.version, 1u);
  EXPECT_EQ(out.id, participant.id);
  EXPECT_EQ(out.first_name, participant.first_name);
  EXPECT_EQ(out.last_name, participant.last_name);
  EXPECT_EQ(out.assets, participant.assets);
}

TEST(encoding_types, record_kind_is_the_leading_byte) {
  auto encoder = encoder_t{};
  auto participant = encoder.encode(
      titlebook::schema::ledger_record_t{make_participant()});
  auto asset = encoder.encode(titlebook::schema::ledger_record_t{
      titlebook::schema::asset_state_t{
          .id = "asset1", .value = 123, .owner = "owner1"}});

  ASSERT_FALSE(participant.empty());
  ASSERT_FALSE(asset.empty());
  EXPECT_EQ(participant[0],
            static_cast<uint8_t>(titlebook::schema::record_kind::participant));
  EXPECT_EQ(asset[0],
            static_cast<uint8_t>(titlebook::schema::record_kind::asset));

  auto decoded = encoder.try_decode<titlebook::schema::ledger_record_t>(
      titlebook::schema::bytes_view_t{asset.data(), asset.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(titlebook::schema::kind_of(*decoded),
            titlebook::schema::record_kind::asset);
  EXPECT_EQ(titlebook::schema::id_of(*decoded), "asset1");
  EXPECT_EQ(std::get<titlebook::schema::asset_state_t>(*decoded).value, 123u);
  EXPECT_EQ(std::get<titlebook::schema::asset_state_t>(*decoded).owner,
            "owner1");
}

TEST(encoding_types, try_decode_rejects_garbage) {
  auto encoder = encoder_t{};
  auto garbage = titlebook::schema::bytes_t{0x07, 0xFF, 0xFF};
  auto decoded = encoder.try_decode<titlebook::schema::ledger_record_t>(
      titlebook::schema::bytes_view_t{garbage.data(), garbage.size()});
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, describe_renders_records) {
  EXPECT_EQ(titlebook::schema::describe(make_participant()),
            "participant id=owner1 first_name=john last_name=doe "
            "assets=[asset1, asset7]");
  EXPECT_EQ(titlebook::schema::describe(titlebook::schema::ledger_record_t{
                titlebook::schema::asset_state_t{
                    .id = "asset2", .value = 456, .owner = "owner2"}}),
            "asset id=asset2 value=456 owner=owner2");
}
