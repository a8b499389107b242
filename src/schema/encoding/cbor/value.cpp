#include <orca/schema/encoding/cbor/plutus_data.hpp>
#include <orca/schema/encoding/cbor/value.hpp>

#include <spdlog/fmt/fmt.h>

#include <map>

namespace orca::schema::encoding::cbor {

namespace {

using asset_bundle_t = std::map<policy_id_t, std::map<bytes_t, quantity_t>>;

template <typename Map>
asset_bundle_t group_by_policy(const Map& assets) {
  auto grouped = asset_bundle_t{};
  for (const auto& [asset, qty] : assets) {
    grouped[asset.policy_id][asset.asset_name] = qty;
  }
  return grouped;
}

void write_bundle(const asset_bundle_t& bundle, writer& out) {
  out.write_map_header(bundle.size());
  for (const auto& [policy, names] : bundle) {
    out.write_bytes(bytes_view_t{policy.data(), policy.size()});
    out.write_map_header(names.size());
    for (const auto& [name, qty] : names) {
      out.write_bytes(make_bytes_view(name));
      out.write_integer(qty);
    }
  }
}

template <typename Visitor>
void read_bundle(reader& in, Visitor&& visit) {
  auto policies = in.read_map_header();
  if (!policies) {
    throw decode_error{"multi-asset map must be definite"};
  }
  for (auto i = uint64_t{0}; i < *policies; ++i) {
    auto policy = read_fixed_bytes<28>(in, "policy id");
    auto names = in.read_map_header();
    if (!names) {
      throw decode_error{"asset map must be definite"};
    }
    for (auto j = uint64_t{0}; j < *names; ++j) {
      auto name = in.read_bytes();
      if (name.size() > 32) {
        throw decode_error{"asset name longer than 32 bytes"};
      }
      auto qty = in.read_integer();
      visit(asset_id_t{.policy_id = policy, .asset_name = std::move(name)},
            qty);
    }
  }
}

}  // namespace

void encode(const value_t& o, writer& out) {
  if (o.assets.empty()) {
    out.write_unsigned(o.coin);
    return;
  }
  out.write_array_header(2);
  out.write_unsigned(o.coin);
  write_bundle(group_by_policy(o.assets), out);
}

void decode(value_t& o, reader& in) {
  o = value_t{};
  if (in.peek_type() == major_type::unsigned_integer) {
    o.coin = in.read_unsigned();
    return;
  }
  auto size = in.read_array_header();
  if (!size || *size != 2) {
    throw decode_error{"value must be a coin or a [coin, assets] pair"};
  }
  o.coin = in.read_unsigned();
  read_bundle(in, [&](asset_id_t asset, const quantity_t qty) {
    if (qty <= 0) {
      throw decode_error{
          fmt::format("output asset quantity must be positive, found {}", qty)};
    }
    o.assets.emplace(std::move(asset), qty);
  });
}

void encode(const mint_t& o, writer& out) {
  write_bundle(group_by_policy(o), out);
}

void decode(mint_t& o, reader& in) {
  o.clear();
  read_bundle(in, [&](asset_id_t asset, const quantity_t qty) {
    if (qty == 0) {
      throw decode_error{"mint entries must be non-zero"};
    }
    o.emplace(std::move(asset), qty);
  });
}

}  // namespace orca::schema::encoding::cbor
