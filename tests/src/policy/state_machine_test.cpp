#include <gtest/gtest.h>
#include <orca/policy/state_machine.hpp>
#include <orca/testing/common.hpp>

#include <algorithm>
#include <vector>

namespace {

using orca::schema::error_code;

constexpr auto kNow = orca::schema::timestamp_milliseconds_t{1'700'000'000'000};
constexpr auto kBalance = orca::schema::quantity_t{10'000};

orca::schema::key_hash_t owner() { return orca::testing::make_key_hash(1); }
orca::schema::key_hash_t platform(const uint8_t i) {
  return orca::testing::make_key_hash(static_cast<uint8_t>(2 + i));
}
orca::schema::key_hash_t node(const uint8_t i) {
  return orca::testing::make_key_hash(static_cast<uint8_t>(10 + i));
}

orca::schema::oracle_state_t make_state() {
  auto state = orca::schema::oracle_state_t{};
  auto& settings = state.settings;
  settings.owner = owner();
  settings.min_nodes = 3;
  settings.node_staleness = 300'000;
  settings.aggregate_time = 600'000;
  settings.aggregate_change = 100;
  settings.rewards = orca::schema::price_rewards_t{
      .node_fee = 10, .aggregate_fee = 5, .platform_fee = 3};
  settings.iqr_multiplier = 2;
  settings.divergence = 1000;
  settings.platform = orca::schema::platform_t{
      .signers = {platform(0), platform(1), platform(2)}, .threshold = 2};
  settings.fee_token = orca::schema::asset_id_t{
      .policy_id = orca::testing::make_key_hash(0xf0),
      .asset_name = {'F', 'E', 'E'}};
  for (uint8_t i = 0; i < 5; ++i) {
    state.nodes.push_back(orca::schema::node_entry_t{.operator_key = node(i)});
  }
  return state;
}

void set_feed(orca::schema::oracle_state_t& state,
              const uint8_t i,
              const int64_t price,
              const orca::schema::timestamp_milliseconds_t at) {
  orca::schema::find_node(state, node(i))->feed =
      orca::schema::data_feed_t{.value = price, .last_update = at};
}

orca::policy::transition_context_t context(
    const orca::schema::quantity_t balance = kBalance) {
  return orca::policy::transition_context_t{
      .now = kNow, .fee_token_balance = balance,
      .reference_script_exists = false};
}

orca::schema::action_request_t request(const orca::schema::key_hash_t& caller,
                                       orca::schema::action_payload_t payload) {
  auto out = orca::schema::action_request_t{};
  out.caller = caller;
  out.payload = std::move(payload);
  return out;
}

orca::schema::action_request_t owner_request(
    orca::schema::action_payload_t payload) {
  auto out = request(owner(), std::move(payload));
  out.platform_signers = {platform(0), platform(2)};
  return out;
}

orca::schema::quantity_t total_paid(const orca::policy::transition_t& t) {
  auto paid = orca::schema::quantity_t{};
  for (const auto& payout : t.payouts) {
    paid += payout.amount;
  }
  return paid;
}

}  // namespace

TEST(state_machine, node_update_records_feed) {
  auto state = make_state();
  auto result = orca::policy::evaluate_transition(
      state,
      request(node(1), orca::schema::node_update_t{.node = node(1),
                                                   .price = 450'000}),
      context());
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_TRUE(result->next_state.has_value());
  const auto* entry = orca::schema::find_node(*result->next_state, node(1));
  ASSERT_TRUE(entry->feed.has_value());
  EXPECT_EQ(entry->feed->value, 450'000);
  EXPECT_EQ(entry->feed->last_update, kNow);
  EXPECT_EQ(result->required_signers,
            (std::vector<orca::schema::key_hash_t>{node(1)}));
  EXPECT_TRUE(result->payouts.empty());
}

TEST(state_machine, node_update_preconditions) {
  auto state = make_state();
  auto foreign = orca::policy::evaluate_transition(
      state,
      request(node(2), orca::schema::node_update_t{.node = node(1),
                                                   .price = 1}),
      context());
  EXPECT_EQ(foreign.code, error_code::illegal_transition);

  auto unknown = orca::schema::node_update_t{
      .node = orca::testing::make_key_hash(99), .price = 1};
  EXPECT_EQ(orca::policy::evaluate_transition(
                state, request(unknown.node, unknown), context())
                .code,
            error_code::illegal_transition);

  EXPECT_EQ(orca::policy::evaluate_transition(
                state,
                request(node(0), orca::schema::node_update_t{.node = node(0),
                                                             .price = 0}),
                context())
                .code,
            error_code::illegal_transition);
}

TEST(state_machine, aggregate_with_enough_fresh_feeds) {
  auto state = make_state();
  set_feed(state, 0, 100, kNow - 1000);
  set_feed(state, 1, 102, kNow - 2000);
  set_feed(state, 2, 101, kNow - 3000);
  set_feed(state, 3, 500, kNow - 4000);

  auto result = orca::policy::evaluate_transition(
      state, request(node(0), orca::schema::aggregate_t{.aggregator = node(0)}),
      context());
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;
  const auto& next = *result->next_state;
  ASSERT_TRUE(next.price.has_value());
  // Median of {100, 101, 102, 500} truncates 101.5.
  EXPECT_EQ(next.price->price, 101);
  EXPECT_EQ(next.price->timestamp, kNow);
  EXPECT_EQ(next.price->expiry, kNow + 600'000);

  // Node 3 diverges, node 4 never submitted.
  EXPECT_EQ(orca::schema::find_node(next, node(0))->reward, 10 + 5);
  EXPECT_EQ(orca::schema::find_node(next, node(1))->reward, 10);
  EXPECT_EQ(orca::schema::find_node(next, node(2))->reward, 10);
  EXPECT_EQ(orca::schema::find_node(next, node(3))->reward, 0);
  EXPECT_EQ(orca::schema::find_node(next, node(4))->reward, 0);
  EXPECT_EQ(next.platform_reward, 3);
  EXPECT_EQ(result->required_signers,
            (std::vector<orca::schema::key_hash_t>{node(0)}));
}

TEST(state_machine, aggregate_below_minimum_nodes_is_illegal) {
  auto state = make_state();
  set_feed(state, 0, 100, kNow - 1000);
  set_feed(state, 1, 101, kNow - 1000);
  // Older than node_staleness.
  set_feed(state, 2, 101, kNow - 300'001);

  auto result = orca::policy::evaluate_transition(
      state, request(node(0), orca::schema::aggregate_t{.aggregator = node(0)}),
      context());
  EXPECT_EQ(result.code, error_code::illegal_transition);
  EXPECT_EQ(orca::policy::fresh_nodes(state, kNow).size(), 2u);
}

TEST(state_machine, feeds_used_by_previous_aggregate_are_not_fresh) {
  auto state = make_state();
  set_feed(state, 0, 100, kNow - 5000);
  set_feed(state, 1, 100, kNow - 5000);
  set_feed(state, 2, 100, kNow - 1000);
  state.price = orca::schema::price_data_t{
      .price = 100, .timestamp = kNow - 5000, .expiry = kNow - 1};
  EXPECT_EQ(orca::policy::fresh_nodes(state, kNow).size(), 1u);
}

TEST(state_machine, aggregate_must_be_due) {
  auto state = make_state();
  for (uint8_t i = 0; i < 3; ++i) {
    set_feed(state, i, 100'050, kNow - 1000);
  }
  state.price = orca::schema::price_data_t{
      .price = 100'000, .timestamp = kNow - 10'000, .expiry = kNow + 10'000};
  auto aggregate =
      request(node(0), orca::schema::aggregate_t{.aggregator = node(0)});

  // 5 basis points is below the 100 basis point threshold.
  EXPECT_EQ(orca::policy::evaluate_transition(state, aggregate, context()).code,
            error_code::illegal_transition);

  // Expired price makes the same feeds due.
  state.price->expiry = kNow;
  EXPECT_TRUE(orca::policy::evaluate_transition(state, aggregate, context())
                  .ok());

  // So does a large enough move.
  state.price->expiry = kNow + 10'000;
  for (uint8_t i = 0; i < 3; ++i) {
    set_feed(state, i, 101'000, kNow - 1000);
  }
  EXPECT_TRUE(orca::policy::evaluate_transition(state, aggregate, context())
                  .ok());
}

TEST(state_machine, aggregate_requires_reserve) {
  auto state = make_state();
  for (uint8_t i = 0; i < 3; ++i) {
    set_feed(state, i, 100, kNow - 1000);
  }
  // Already allocated rewards count against the balance.
  orca::schema::find_node(state, node(4))->reward = 20;
  auto aggregate =
      request(node(0), orca::schema::aggregate_t{.aggregator = node(0)});

  auto short_reserve =
      orca::policy::evaluate_transition(state, aggregate, context(57));
  EXPECT_EQ(short_reserve.code, error_code::insufficient_funds);
  EXPECT_NE(short_reserve.info.find("missing 1"), std::string::npos);

  EXPECT_TRUE(
      orca::policy::evaluate_transition(state, aggregate, context(58)).ok());
}

TEST(state_machine, aggregator_must_be_registered_node) {
  auto state = make_state();
  for (uint8_t i = 0; i < 3; ++i) {
    set_feed(state, i, 100, kNow - 1000);
  }
  auto outsider = orca::testing::make_key_hash(77);
  EXPECT_EQ(orca::policy::evaluate_transition(
                state,
                request(outsider,
                        orca::schema::aggregate_t{.aggregator = outsider}),
                context())
                .code,
            error_code::illegal_transition);
}

TEST(state_machine, node_collect_pays_and_zeroes_reward) {
  auto state = make_state();
  orca::schema::find_node(state, node(2))->reward = 40;
  auto collect =
      request(node(2), orca::schema::node_collect_t{.node = node(2)});

  auto result = orca::policy::evaluate_transition(state, collect, context());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(orca::schema::find_node(*result->next_state, node(2))->reward, 0);
  ASSERT_EQ(result->payouts.size(), 1u);
  EXPECT_EQ(result->payouts[0],
            (orca::policy::payout_t{.recipient = node(2), .amount = 40}));

  auto empty = make_state();
  EXPECT_EQ(orca::policy::evaluate_transition(empty, collect, context()).code,
            error_code::illegal_transition);
}

TEST(state_machine, owner_actions_need_platform_threshold) {
  auto state = make_state();
  state.platform_reward = 12;

  auto collect = owner_request(orca::schema::platform_collect_t{});
  auto result = orca::policy::evaluate_transition(state, collect, context());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result->next_state->platform_reward, 0);
  EXPECT_EQ(total_paid(*result), 12);
  auto expected = std::vector<orca::schema::key_hash_t>{owner(), platform(0),
                                                        platform(2)};
  std::sort(std::begin(expected), std::end(expected));
  EXPECT_EQ(result->required_signers, expected);

  auto below = collect;
  below.platform_signers = {platform(0)};
  EXPECT_EQ(orca::policy::evaluate_transition(state, below, context()).code,
            error_code::illegal_transition);

  auto repeated = collect;
  repeated.platform_signers = {platform(0), platform(0)};
  EXPECT_EQ(orca::policy::evaluate_transition(state, repeated, context()).code,
            error_code::illegal_transition);

  auto stranger = collect;
  stranger.platform_signers = {platform(0), orca::testing::make_key_hash(88)};
  EXPECT_EQ(orca::policy::evaluate_transition(state, stranger, context()).code,
            error_code::illegal_transition);

  auto not_owner = collect;
  not_owner.caller = node(0);
  EXPECT_EQ(orca::policy::evaluate_transition(state, not_owner, context()).code,
            error_code::illegal_transition);
}

TEST(state_machine, edit_settings_validates_record) {
  auto state = make_state();
  auto unchanged =
      owner_request(orca::schema::edit_settings_t{.settings = state.settings});
  EXPECT_EQ(orca::policy::evaluate_transition(state, unchanged, context()).code,
            error_code::illegal_transition);

  auto invalid = state.settings;
  invalid.platform.threshold = 4;
  EXPECT_EQ(orca::policy::evaluate_transition(
                state,
                owner_request(orca::schema::edit_settings_t{.settings = invalid}),
                context())
                .code,
            error_code::illegal_transition);

  auto edited = state.settings;
  edited.min_nodes = 4;
  auto result = orca::policy::evaluate_transition(
      state, owner_request(orca::schema::edit_settings_t{.settings = edited}),
      context());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result->next_state->settings.min_nodes, 4u);
}

TEST(state_machine, add_nodes_rejects_known_and_repeated_keys) {
  auto state = make_state();
  auto fresh = orca::testing::make_key_hash(60);

  auto result = orca::policy::evaluate_transition(
      state, owner_request(orca::schema::add_nodes_t{.nodes = {fresh}}),
      context());
  ASSERT_TRUE(result.ok()) << result.log;
  const auto* added = orca::schema::find_node(*result->next_state, fresh);
  ASSERT_NE(added, nullptr);
  EXPECT_FALSE(added->feed.has_value());
  EXPECT_EQ(added->reward, 0);

  EXPECT_EQ(orca::policy::evaluate_transition(
                state,
                owner_request(orca::schema::add_nodes_t{.nodes = {node(0)}}),
                context())
                .code,
            error_code::illegal_transition);
  EXPECT_EQ(
      orca::policy::evaluate_transition(
          state, owner_request(orca::schema::add_nodes_t{.nodes = {fresh, fresh}}),
          context())
          .code,
      error_code::illegal_transition);
}

TEST(state_machine, remove_nodes_with_reward_needs_settlement) {
  auto state = make_state();
  orca::schema::find_node(state, node(3))->reward = 25;

  auto unsettled = owner_request(orca::schema::remove_nodes_t{
      .nodes = {node(3)}, .settle_rewards = false});
  EXPECT_EQ(orca::policy::evaluate_transition(state, unsettled, context()).code,
            error_code::illegal_transition);

  auto settled = owner_request(orca::schema::remove_nodes_t{
      .nodes = {node(3), node(4)}, .settle_rewards = true});
  auto result = orca::policy::evaluate_transition(state, settled, context());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result->next_state->nodes.size(), 3u);
  EXPECT_EQ(orca::schema::find_node(*result->next_state, node(3)), nullptr);
  ASSERT_EQ(result->payouts.size(), 1u);
  EXPECT_EQ(result->payouts[0].recipient, node(3));
  EXPECT_EQ(result->payouts[0].amount, 25);
}

TEST(state_machine, close_disbursement) {
  auto state = make_state();
  orca::schema::find_node(state, node(0))->reward = 30;
  orca::schema::find_node(state, node(1))->reward = 20;
  state.platform_reward = 7;

  auto to_owner = owner_request(orca::schema::close_oracle_t{
      .disbursement = orca::schema::disbursement_t::to_owner});
  EXPECT_EQ(orca::policy::evaluate_transition(state, to_owner, context()).code,
            error_code::illegal_transition);

  auto to_nodes = owner_request(orca::schema::close_oracle_t{
      .disbursement = orca::schema::disbursement_t::to_nodes});
  auto result = orca::policy::evaluate_transition(state, to_nodes, context());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(result->burn_state_token);
  EXPECT_FALSE(result->next_state.has_value());
  EXPECT_EQ(result->residual_recipient, owner());
  EXPECT_EQ(total_paid(*result), kBalance);
  ASSERT_EQ(result->payouts.size(), 3u);
  EXPECT_EQ(result->payouts.back().recipient, owner());
  EXPECT_EQ(result->payouts.back().amount, kBalance - 50);

  auto drained = make_state();
  auto owner_only =
      orca::policy::evaluate_transition(drained, to_owner, context());
  ASSERT_TRUE(owner_only.ok()) << owner_only.log;
  EXPECT_EQ(owner_only->payouts,
            (std::vector<orca::policy::payout_t>{
                {.recipient = owner(), .amount = kBalance}}));
}

TEST(state_machine, close_with_rewards_above_reserve_is_insufficient) {
  auto state = make_state();
  orca::schema::find_node(state, node(0))->reward = 100;
  auto to_nodes = owner_request(orca::schema::close_oracle_t{
      .disbursement = orca::schema::disbursement_t::to_nodes});

  auto result = orca::policy::evaluate_transition(state, to_nodes, context(50));
  EXPECT_EQ(result.code, error_code::insufficient_funds);
  EXPECT_EQ(result.codespace, "orca.resource");
  EXPECT_NE(result.info.find("missing 50"), std::string::npos);

  auto exact = orca::policy::evaluate_transition(state, to_nodes, context(100));
  ASSERT_TRUE(exact.ok()) << exact.log;
  for (const auto& payout : exact->payouts) {
    EXPECT_GE(payout.amount, 0);
  }
}

TEST(state_machine, payouts_cannot_exceed_balance) {
  auto state = make_state();
  orca::schema::find_node(state, node(0))->reward = 30;
  auto collect =
      request(node(0), orca::schema::node_collect_t{.node = node(0)});
  EXPECT_EQ(orca::policy::evaluate_transition(state, collect, context(29)).code,
            error_code::insufficient_funds);
}

TEST(state_machine, closed_oracle_rejects_everything) {
  auto state = make_state();
  state.status = orca::schema::lifecycle_status_t::closed;
  EXPECT_EQ(orca::policy::evaluate_transition(
                state,
                request(node(0), orca::schema::add_funds_t{.amount = 10}),
                context())
                .code,
            error_code::illegal_transition);
}

TEST(state_machine, add_funds_and_reference_script) {
  auto state = make_state();
  auto funding = orca::policy::evaluate_transition(
      state, request(node(4), orca::schema::add_funds_t{.amount = 500}),
      context());
  ASSERT_TRUE(funding.ok()) << funding.log;
  EXPECT_EQ(funding->funding, 500);
  EXPECT_EQ(*funding->next_state, state);
  EXPECT_EQ(funding->required_signers,
            (std::vector<orca::schema::key_hash_t>{node(4)}));

  EXPECT_EQ(orca::policy::evaluate_transition(
                state, request(node(4), orca::schema::add_funds_t{.amount = 0}),
                context())
                .code,
            error_code::illegal_transition);

  auto publish = owner_request(orca::schema::create_reference_script_t{});
  auto published = orca::policy::evaluate_transition(state, publish, context());
  ASSERT_TRUE(published.ok()) << published.log;
  EXPECT_FALSE(published->next_state.has_value());
  EXPECT_FALSE(published->burn_state_token);

  auto exists = context();
  exists.reference_script_exists = true;
  EXPECT_EQ(orca::policy::evaluate_transition(state, publish, exists).code,
            error_code::illegal_transition);
}
