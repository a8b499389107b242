#include <orca/schema/value.hpp>

#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace orca::schema {

value_t make_value(const lovelace_t coin) {
  return value_t{.coin = coin, .assets = {}};
}

value_t make_value(const lovelace_t coin,
                   const asset_id_t& asset,
                   const quantity_t qty) {
  auto value = make_value(coin);
  if (qty > 0) {
    value.assets.emplace(asset, qty);
  }
  return value;
}

quantity_t quantity_of(const value_t& value, const asset_id_t& asset) {
  auto it = value.assets.find(asset);
  if (it == std::end(value.assets)) {
    return 0;
  }
  return it->second;
}

bool adjust_asset(value_t& value, const asset_id_t& asset, const quantity_t qty) {
  if (qty == 0) {
    return true;
  }
  auto current = quantity_of(value, asset);
  auto next = current + qty;
  if (next < 0) {
    return false;
  }
  if (next == 0) {
    value.assets.erase(asset);
  } else {
    value.assets[asset] = next;
  }
  return true;
}

value_t add(const value_t& lhs, const value_t& rhs) {
  auto out = lhs;
  out.coin += rhs.coin;
  for (const auto& [asset, qty] : rhs.assets) {
    adjust_asset(out, asset, qty);
  }
  return out;
}

value_t saturating_subtract(const value_t& lhs, const value_t& rhs) {
  auto out = value_t{};
  out.coin = lhs.coin > rhs.coin ? lhs.coin - rhs.coin : 0;
  for (const auto& [asset, qty] : lhs.assets) {
    auto remaining = qty - quantity_of(rhs, asset);
    if (remaining > 0) {
      out.assets.emplace(asset, remaining);
    }
  }
  return out;
}

bool covers(const value_t& have, const value_t& need) {
  if (have.coin < need.coin) {
    return false;
  }
  for (const auto& [asset, qty] : need.assets) {
    if (quantity_of(have, asset) < qty) {
      return false;
    }
  }
  return true;
}

bool is_zero(const value_t& value) {
  return value.coin == 0 && value.assets.empty();
}

std::optional<value_t> apply_mint(const value_t& value, const mint_t& mint) {
  auto out = value;
  for (const auto& [asset, qty] : mint) {
    if (!adjust_asset(out, asset, qty)) {
      return std::nullopt;
    }
  }
  return out;
}

std::string describe(const value_t& value) {
  auto out = fmt::format("{} lovelace", value.coin);
  for (const auto& [asset, qty] : value.assets) {
    out += fmt::format(" + {} {}.{}", qty, to_hex(asset.policy_id),
                       to_hex(make_bytes_view(asset.asset_name)));
  }
  return out;
}

}  // namespace orca::schema
