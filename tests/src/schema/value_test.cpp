#include <gtest/gtest.h>
#include <orca/schema/value.hpp>

#include <string_view>

namespace {

orca::schema::asset_id_t make_asset(const uint8_t seed,
                                    const std::string_view name) {
  auto asset = orca::schema::asset_id_t{};
  asset.policy_id.fill(seed);
  asset.asset_name = orca::schema::make_bytes(name);
  return asset;
}

}  // namespace

TEST(value, adjust_asset_removes_zero_entries) {
  auto token = make_asset(1, "FEE");
  auto value = orca::schema::make_value(5, token, 10);
  EXPECT_TRUE(orca::schema::adjust_asset(value, token, -10));
  EXPECT_TRUE(value.assets.empty());
  EXPECT_EQ(value.coin, 5u);
}

TEST(value, adjust_asset_refuses_negative_balance) {
  auto token = make_asset(1, "FEE");
  auto value = orca::schema::make_value(5, token, 10);
  EXPECT_FALSE(orca::schema::adjust_asset(value, token, -11));
  EXPECT_EQ(orca::schema::quantity_of(value, token), 10);
}

TEST(value, covers_and_saturating_subtract) {
  auto token = make_asset(1, "FEE");
  auto other = make_asset(2, "NFT");
  auto have = orca::schema::add(orca::schema::make_value(100, token, 3),
                                orca::schema::make_value(0, other, 1));
  auto need = orca::schema::make_value(40, token, 5);
  EXPECT_FALSE(orca::schema::covers(have, need));

  auto missing = orca::schema::saturating_subtract(need, have);
  EXPECT_EQ(missing.coin, 0u);
  EXPECT_EQ(orca::schema::quantity_of(missing, token), 2);
  EXPECT_EQ(orca::schema::quantity_of(missing, other), 0);

  EXPECT_TRUE(orca::schema::covers(have, orca::schema::make_value(100)));
  EXPECT_TRUE(orca::schema::is_zero(orca::schema::value_t{}));
}

TEST(value, apply_mint_burns_and_rejects_overdraw) {
  auto nft = make_asset(7, "ORCA");
  auto value = orca::schema::make_value(2'000'000, nft, 1);

  auto burned = orca::schema::apply_mint(value, {{nft, -1}});
  ASSERT_TRUE(burned.has_value());
  EXPECT_EQ(*burned, orca::schema::make_value(2'000'000));

  EXPECT_FALSE(orca::schema::apply_mint(value, {{nft, -2}}).has_value());
}

TEST(value, describe_lists_every_component) {
  auto token = make_asset(0xab, "A");
  auto text = orca::schema::describe(orca::schema::make_value(7, token, 2));
  EXPECT_NE(text.find("7 lovelace"), std::string::npos);
  EXPECT_NE(text.find("+ 2 abab"), std::string::npos);
}
