#include <orca/schema/encoding/cbor/oracle_state.hpp>
#include <orca/schema/encoding/cbor/plutus_data.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>

// Datum layout, fixed by the deployed validator:
//
//   OracleState   = Constr 0 [price, [NodeEntry], Settings, platform_reward,
//                             status]
//   price         = Constr 2 [{0: price, 1: timestamp, 2: expiry}]
//                 | Constr 1 []                                   (nothing)
//   NodeEntry     = Constr 0 [operator, feed, reward]
//   feed          = Constr 0 [Constr 0 [value, last_update]]
//                 | Constr 1 []                                   (nothing)
//   Settings      = Constr 0 [owner, min_nodes, node_staleness,
//                             aggregate_time, aggregate_change, Rewards,
//                             iqr_multiplier, divergence, Platform, FeeToken]
//   Rewards       = Constr 0 [node_fee, aggregate_fee, platform_fee]
//   Platform      = Constr 0 [[signer], threshold]
//   FeeToken      = Constr 0 [policy_id, asset_name]
//   status        = Constr 0 [] (active) | Constr 1 [] (closed)
namespace orca::schema::encoding::cbor {

namespace {

inline constexpr uint64_t kPriceDataConstr = 2;
inline constexpr uint64_t kNothingConstr = 1;

template <typename T>
T read_bounded(reader& in, const std::string_view what) {
  auto value = in.read_integer();
  if (value < 0 ||
      static_cast<uint64_t>(value) >
          static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    throw decode_error{fmt::format("{}: {} out of range", what, value)};
  }
  return static_cast<T>(value);
}

void write_key(const hash28_t& key, writer& out) {
  out.write_bytes(bytes_view_t{key.data(), key.size()});
}

void write_unit_constr(const uint64_t index, writer& out) {
  begin_constr(out, index, 0);
  end_list(out, 0);
}

void encode_feed(const std::optional<data_feed_t>& feed, writer& out) {
  if (!feed) {
    write_unit_constr(kNothingConstr, out);
    return;
  }
  begin_constr(out, 0, 1);
  begin_constr(out, 0, 2);
  out.write_integer(feed->value);
  out.write_unsigned(feed->last_update);
  end_list(out, 2);
  end_list(out, 1);
}

void decode_feed(std::optional<data_feed_t>& feed, reader& in) {
  auto index = read_constr(in);
  if (index == kNothingConstr) {
    end_list(in, read_fields(in, 0, "feed"));
    feed.reset();
    return;
  }
  if (index != 0) {
    throw decode_error{
        fmt::format("feed: expected constructor 0 or 1, found {}", index)};
  }
  auto outer = read_fields(in, 1, "price feed");
  auto inner = expect_constr(in, 0, 2, "data feed");
  auto value = data_feed_t{};
  value.value = in.read_integer();
  value.last_update = read_bounded<uint64_t>(in, "data feed last_update");
  end_list(in, inner);
  end_list(in, outer);
  feed = value;
}

void encode_key_list(const std::vector<key_hash_t>& keys, writer& out) {
  begin_list(out, keys.size());
  for (const auto& key : keys) {
    write_key(key, out);
  }
  end_list(out, keys.size());
}

void decode_key_list(std::vector<key_hash_t>& keys,
                     reader& in,
                     const std::string_view what) {
  keys.clear();
  auto header = read_list(in);
  for (auto i = uint64_t{0}; i < header.size; ++i) {
    keys.push_back(read_fixed_bytes<28>(in, what));
  }
  end_list(in, header);
}

}  // namespace

void encode(const price_data_t& o, writer& out) {
  begin_constr(out, kPriceDataConstr, 1);
  out.write_map_header(3);
  out.write_unsigned(0);
  out.write_integer(o.price);
  out.write_unsigned(1);
  out.write_unsigned(o.timestamp);
  out.write_unsigned(2);
  out.write_unsigned(o.expiry);
  end_list(out, 1);
}

void decode(price_data_t& o, reader& in) {
  auto fields = expect_constr(in, kPriceDataConstr, 1, "price data");
  auto entries = in.read_map_header();
  if (!entries || *entries != 3) {
    throw decode_error{"price data: expected a 3-entry map"};
  }
  auto seen = std::array<bool, 3>{};
  for (auto i = 0; i < 3; ++i) {
    auto key = in.read_unsigned();
    if (key > 2 || seen[key]) {
      throw decode_error{fmt::format("price data: unexpected key {}", key)};
    }
    seen[key] = true;
    switch (key) {
      case 0:
        o.price = in.read_integer();
        break;
      case 1:
        o.timestamp = read_bounded<uint64_t>(in, "price data timestamp");
        break;
      default:
        o.expiry = read_bounded<uint64_t>(in, "price data expiry");
        break;
    }
  }
  end_list(in, fields);
}

void encode(const node_entry_t& o, writer& out) {
  begin_constr(out, 0, 3);
  write_key(o.operator_key, out);
  encode_feed(o.feed, out);
  out.write_integer(o.reward);
  end_list(out, 3);
}

void decode(node_entry_t& o, reader& in) {
  auto fields = expect_constr(in, 0, 3, "node entry");
  o.operator_key = read_fixed_bytes<28>(in, "node operator");
  decode_feed(o.feed, in);
  o.reward = read_bounded<int64_t>(in, "node reward");
  end_list(in, fields);
}

void encode(const oracle_settings_t& o, writer& out) {
  begin_constr(out, 0, 10);
  write_key(o.owner, out);
  out.write_unsigned(o.min_nodes);
  out.write_unsigned(o.node_staleness);
  out.write_unsigned(o.aggregate_time);
  out.write_unsigned(o.aggregate_change);

  begin_constr(out, 0, 3);
  out.write_integer(o.rewards.node_fee);
  out.write_integer(o.rewards.aggregate_fee);
  out.write_integer(o.rewards.platform_fee);
  end_list(out, 3);

  out.write_unsigned(o.iqr_multiplier);
  out.write_unsigned(o.divergence);

  begin_constr(out, 0, 2);
  encode_key_list(o.platform.signers, out);
  out.write_unsigned(o.platform.threshold);
  end_list(out, 2);

  begin_constr(out, 0, 2);
  write_key(o.fee_token.policy_id, out);
  out.write_bytes(make_bytes_view(o.fee_token.asset_name));
  end_list(out, 2);

  end_list(out, 10);
}

void decode(oracle_settings_t& o, reader& in) {
  auto fields = expect_constr(in, 0, 10, "settings");
  o.owner = read_fixed_bytes<28>(in, "settings owner");
  o.min_nodes = read_bounded<uint32_t>(in, "settings min_nodes");
  o.node_staleness = read_bounded<uint64_t>(in, "settings node_staleness");
  o.aggregate_time = read_bounded<uint64_t>(in, "settings aggregate_time");
  o.aggregate_change = read_bounded<uint32_t>(in, "settings aggregate_change");

  auto rewards = expect_constr(in, 0, 3, "rewards");
  o.rewards.node_fee = read_bounded<int64_t>(in, "node_fee");
  o.rewards.aggregate_fee = read_bounded<int64_t>(in, "aggregate_fee");
  o.rewards.platform_fee = read_bounded<int64_t>(in, "platform_fee");
  end_list(in, rewards);

  o.iqr_multiplier = read_bounded<uint32_t>(in, "settings iqr_multiplier");
  o.divergence = read_bounded<uint32_t>(in, "settings divergence");

  auto platform = expect_constr(in, 0, 2, "platform");
  decode_key_list(o.platform.signers, in, "platform signer");
  o.platform.threshold = read_bounded<uint32_t>(in, "platform threshold");
  end_list(in, platform);

  auto token = expect_constr(in, 0, 2, "fee token");
  o.fee_token.policy_id = read_fixed_bytes<28>(in, "fee token policy");
  o.fee_token.asset_name = in.read_bytes();
  end_list(in, token);

  end_list(in, fields);
}

void encode(const oracle_state_t& o, writer& out) {
  begin_constr(out, 0, 5);
  if (o.price) {
    encode(*o.price, out);
  } else {
    write_unit_constr(kNothingConstr, out);
  }
  begin_list(out, o.nodes.size());
  for (const auto& node : o.nodes) {
    encode(node, out);
  }
  end_list(out, o.nodes.size());
  encode(o.settings, out);
  out.write_integer(o.platform_reward);
  write_unit_constr(static_cast<uint64_t>(o.status), out);
  end_list(out, 5);
}

void decode(oracle_state_t& o, reader& in) {
  auto fields = expect_constr(in, 0, 5, "oracle state");

  auto lookahead = in;
  auto price_index = read_constr(lookahead);
  if (price_index == kNothingConstr) {
    read_constr(in);
    end_list(in, read_fields(in, 0, "price"));
    o.price.reset();
  } else {
    auto price = price_data_t{};
    decode(price, in);
    o.price = price;
  }

  o.nodes.clear();
  auto nodes = read_list(in);
  for (auto i = uint64_t{0}; i < nodes.size; ++i) {
    auto node = node_entry_t{};
    decode(node, in);
    o.nodes.push_back(std::move(node));
  }
  end_list(in, nodes);

  decode(o.settings, in);
  o.platform_reward = read_bounded<int64_t>(in, "platform reward");

  auto status = read_constr(in);
  if (status > static_cast<uint64_t>(lifecycle_status_t::closed)) {
    throw decode_error{
        fmt::format("status: expected constructor 0 or 1, found {}", status)};
  }
  end_list(in, read_fields(in, 0, "status"));
  o.status = static_cast<lifecycle_status_t>(status);

  end_list(in, fields);
}

}  // namespace orca::schema::encoding::cbor
