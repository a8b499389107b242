#pragma once

#include <orca/schema/primitives.hpp>

#include <compare>
#include <map>
#include <optional>
#include <string>

namespace orca::schema {

/// Native asset identifier. An empty policy id never appears in a value; the
/// ada coin is tracked separately in `value_t::coin`.
struct asset_id_t final {
  policy_id_t policy_id{};
  bytes_t asset_name;

  auto operator<=>(const asset_id_t&) const = default;
  bool operator==(const asset_id_t&) const = default;
};

using mint_t = std::map<asset_id_t, quantity_t>;

/// Ledger value bundle. Asset quantities are strictly positive; a zero entry
/// is removed rather than stored.
struct value_t final {
  lovelace_t coin{};
  std::map<asset_id_t, quantity_t> assets;

  bool operator==(const value_t&) const = default;
};

value_t make_value(lovelace_t coin);
value_t make_value(lovelace_t coin, const asset_id_t& asset, quantity_t qty);

quantity_t quantity_of(const value_t& value, const asset_id_t& asset);

/// Add `qty` (possibly negative) of `asset`. Returns false and leaves the
/// value unchanged when the result would go negative.
bool adjust_asset(value_t& value, const asset_id_t& asset, quantity_t qty);

value_t add(const value_t& lhs, const value_t& rhs);

/// Component-wise max(lhs - rhs, 0).
value_t saturating_subtract(const value_t& lhs, const value_t& rhs);

/// True when `have` holds at least `need` of every component.
bool covers(const value_t& have, const value_t& need);

bool is_zero(const value_t& value);

/// Apply minted (positive) and burned (negative) quantities.
std::optional<value_t> apply_mint(const value_t& value, const mint_t& mint);

std::string describe(const value_t& value);

}  // namespace orca::schema
