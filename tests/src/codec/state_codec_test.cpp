#include <gtest/gtest.h>
#include <orca/codec/state_codec.hpp>
#include <orca/schema/action_request.hpp>
#include <orca/schema/encoding/cbor/plutus_data.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/testing/common.hpp>

#include <string_view>
#include <vector>

namespace {

orca::schema::oracle_settings_t make_settings() {
  auto settings = orca::schema::oracle_settings_t{};
  settings.owner = orca::testing::make_key_hash(1);
  settings.min_nodes = 3;
  settings.node_staleness = 300'000;
  settings.aggregate_time = 600'000;
  settings.aggregate_change = 100;
  settings.rewards = orca::schema::price_rewards_t{
      .node_fee = 10, .aggregate_fee = 5, .platform_fee = 3};
  settings.iqr_multiplier = 2;
  settings.divergence = 1000;
  settings.platform = orca::schema::platform_t{
      .signers = {orca::testing::make_key_hash(2),
                  orca::testing::make_key_hash(3)},
      .threshold = 1};
  settings.fee_token = orca::schema::asset_id_t{
      .policy_id = orca::testing::make_key_hash(0xf0),
      .asset_name = orca::schema::make_bytes(std::string_view{"FEE"})};
  return settings;
}

orca::schema::oracle_state_t make_state() {
  auto state = orca::schema::oracle_state_t{};
  state.settings = make_settings();
  state.price = orca::schema::price_data_t{
      .price = 451'230, .timestamp = 1'700'000'000'000,
      .expiry = 1'700'000'600'000};
  for (uint8_t i = 0; i < 5; ++i) {
    auto node = orca::schema::node_entry_t{};
    node.operator_key = orca::testing::make_key_hash(10 + i);
    node.reward = i * 10;
    if (i % 2 == 0) {
      node.feed = orca::schema::data_feed_t{
          .value = 450'000 + i, .last_update = 1'700'000'100'000};
    }
    state.nodes.push_back(node);
  }
  state.platform_reward = 9;
  return state;
}

}  // namespace

TEST(state_codec, state_round_trips) {
  auto state = make_state();
  auto decoded =
      orca::codec::decode_state(orca::schema::make_bytes_view(
          orca::codec::encode_state(state)));
  ASSERT_TRUE(decoded.ok()) << decoded.log << " " << decoded.info;
  EXPECT_EQ(*decoded, state);

  state.price.reset();
  state.nodes.clear();
  state.status = orca::schema::lifecycle_status_t::closed;
  decoded = orca::codec::decode_state(
      orca::schema::make_bytes_view(orca::codec::encode_state(state)));
  ASSERT_TRUE(decoded.ok()) << decoded.log << " " << decoded.info;
  EXPECT_EQ(*decoded, state);
}

TEST(state_codec, every_action_round_trips_as_redeemer) {
  auto key = orca::testing::make_key_hash(10);
  auto settings = make_settings();
  settings.min_nodes = 4;
  auto payloads = std::vector<orca::schema::action_payload_t>{
      orca::schema::node_update_t{.node = key, .price = 451'000},
      orca::schema::node_collect_t{.node = key},
      orca::schema::platform_collect_t{},
      orca::schema::aggregate_t{.aggregator = key},
      orca::schema::edit_settings_t{.settings = settings},
      orca::schema::add_nodes_t{
          .nodes = {key, orca::testing::make_key_hash(20)}},
      orca::schema::remove_nodes_t{.nodes = {key}, .settle_rewards = true},
      orca::schema::close_oracle_t{
          .disbursement = orca::schema::disbursement_t::to_owner},
      orca::schema::add_funds_t{.amount = 5'000},
      orca::schema::create_reference_script_t{}};

  for (const auto& payload : payloads) {
    auto encoded = orca::codec::encode_redeemer(payload);
    auto decoded =
        orca::codec::decode_redeemer(orca::schema::make_bytes_view(encoded));
    ASSERT_TRUE(decoded.ok()) << orca::schema::action_name(payload) << ": "
                              << decoded.info;
    EXPECT_EQ(decoded->index(), payload.index());
    EXPECT_EQ(*decoded, payload) << orca::schema::action_name(payload);
  }
}

TEST(state_codec, redeemer_constructor_matches_variant_index) {
  auto encoded = orca::codec::encode_redeemer(orca::schema::add_funds_t{
      .amount = 1});
  // Constr 8 uses the extended tag range (1280 + 1).
  ASSERT_GE(encoded.size(), 3u);
  EXPECT_EQ(encoded[0], 0xd9);
  EXPECT_EQ(encoded[1], 0x05);
  EXPECT_EQ(encoded[2], 0x01);
}

TEST(state_codec, burn_redeemer_is_empty_constructor_zero) {
  EXPECT_EQ(orca::codec::encode_burn_redeemer(),
            (orca::schema::bytes_t{0xd8, 0x79, 0x80}));
}

TEST(state_codec, malformed_datum_is_schema_mismatch) {
  auto garbage = orca::schema::bytes_t{0x01, 0x02, 0x03};
  auto decoded =
      orca::codec::decode_state(orca::schema::make_bytes_view(garbage));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
  EXPECT_EQ(decoded.codespace, "orca.schema");
  EXPECT_FALSE(decoded.value.has_value());
}

TEST(state_codec, foreign_datum_shape_is_schema_mismatch) {
  // A redeemer is well-formed Plutus data but not an oracle state.
  auto redeemer = orca::codec::encode_redeemer(orca::schema::aggregate_t{
      .aggregator = orca::testing::make_key_hash(1)});
  auto decoded =
      orca::codec::decode_state(orca::schema::make_bytes_view(redeemer));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
  EXPECT_FALSE(decoded.info.empty());
}

TEST(state_codec, trailing_bytes_are_schema_mismatch) {
  auto encoded = orca::codec::encode_state(make_state());
  encoded.push_back(0x00);
  auto decoded =
      orca::codec::decode_state(orca::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
}

TEST(state_codec, duplicate_node_is_schema_mismatch) {
  auto state = make_state();
  state.nodes.push_back(state.nodes.front());
  auto decoded = orca::codec::decode_state(
      orca::schema::make_bytes_view(orca::codec::encode_state(state)));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
}

TEST(state_codec, negative_reward_is_schema_mismatch) {
  auto state = make_state();
  state.nodes[1].reward = -1;
  auto decoded = orca::codec::decode_state(
      orca::schema::make_bytes_view(orca::codec::encode_state(state)));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
}

TEST(state_codec, unknown_redeemer_constructor_is_schema_mismatch) {
  auto out = orca::schema::encoding::cbor::writer{};
  orca::schema::encoding::cbor::begin_constr(out, 42, 0);
  orca::schema::encoding::cbor::end_list(out, 0);
  auto decoded =
      orca::codec::decode_redeemer(orca::schema::make_bytes_view(out.bytes()));
  EXPECT_EQ(decoded.code, orca::schema::error_code::schema_mismatch);
}

TEST(state_codec, settings_validation) {
  auto settings = make_settings();
  EXPECT_FALSE(orca::codec::settings_violation(settings).has_value());

  auto no_nodes = settings;
  no_nodes.min_nodes = 0;
  EXPECT_TRUE(orca::codec::settings_violation(no_nodes).has_value());

  auto zero_divergence = settings;
  zero_divergence.divergence = 0;
  EXPECT_TRUE(orca::codec::settings_violation(zero_divergence).has_value());

  auto negative_fee = settings;
  negative_fee.rewards.node_fee = -1;
  EXPECT_TRUE(orca::codec::settings_violation(negative_fee).has_value());

  auto threshold = settings;
  threshold.platform.threshold = 3;
  EXPECT_TRUE(orca::codec::settings_violation(threshold).has_value());

  auto repeated = settings;
  repeated.platform.signers.push_back(repeated.platform.signers.front());
  EXPECT_TRUE(orca::codec::settings_violation(repeated).has_value());
}

TEST(state_codec, transaction_id_ignores_witnesses) {
  auto tx = orca::schema::transaction_t{};
  tx.body.inputs.push_back(orca::schema::output_reference_t{
      .tx_id = orca::testing::make_hash(1), .index = 0});
  tx.body.outputs.push_back(orca::schema::transaction_output_t{
      .address = orca::schema::bytes_t(29, 0x60),
      .value = orca::schema::make_value(2'000'000)});
  tx.body.fee = 170'000;
  tx.body.ttl = 1'000;
  tx.body.required_signers.push_back(orca::testing::make_key_hash(1));

  auto unsigned_id = orca::codec::transaction_id(tx.body);
  auto encoded = orca::codec::encode_transaction(tx);
  auto decoded =
      orca::codec::decode_transaction(orca::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.ok()) << decoded.info;
  EXPECT_EQ(*decoded, tx);

  tx.witnesses.vkey_witnesses.push_back(orca::schema::vkey_witness_t{});
  EXPECT_EQ(orca::codec::transaction_id(tx.body), unsigned_id);
  EXPECT_NE(orca::codec::encode_transaction(tx), encoded);

  tx.body.fee += 1;
  EXPECT_NE(orca::codec::transaction_id(tx.body), unsigned_id);
}
