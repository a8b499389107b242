#include <orca/schema/encoding/cbor/action_request.hpp>
#include <orca/schema/encoding/cbor/oracle_state.hpp>
#include <orca/schema/encoding/cbor/plutus_data.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <variant>

namespace orca::schema::encoding::cbor {

namespace {

void write_key(const key_hash_t& key, writer& out) {
  out.write_bytes(bytes_view_t{key.data(), key.size()});
}

void write_keys(const std::vector<key_hash_t>& keys, writer& out) {
  begin_list(out, keys.size());
  for (const auto& key : keys) {
    write_key(key, out);
  }
  end_list(out, keys.size());
}

std::vector<key_hash_t> read_keys(reader& in) {
  auto keys = std::vector<key_hash_t>{};
  auto header = read_list(in);
  for (auto i = uint64_t{0}; i < header.size; ++i) {
    keys.push_back(read_fixed_bytes<28>(in, "node key"));
  }
  end_list(in, header);
  return keys;
}

// Plutus Bool and two-way enums: False/first = Constr 0, True/second = 1.
void write_flag(const uint64_t index, writer& out) {
  begin_constr(out, index, 0);
  end_list(out, 0);
}

uint64_t read_flag(reader& in, const std::string_view what) {
  auto index = read_constr(in);
  if (index > 1) {
    throw decode_error{
        fmt::format("{}: expected constructor 0 or 1, found {}", what, index)};
  }
  end_list(in, read_fields(in, 0, what));
  return index;
}

void encode_fields(const node_update_t& o, writer& out) {
  write_key(o.node, out);
  out.write_integer(o.price);
}

void encode_fields(const node_collect_t& o, writer& out) {
  write_key(o.node, out);
}

void encode_fields(const platform_collect_t&, writer&) {}

void encode_fields(const aggregate_t& o, writer& out) {
  write_key(o.aggregator, out);
}

void encode_fields(const edit_settings_t& o, writer& out) {
  encode(o.settings, out);
}

void encode_fields(const add_nodes_t& o, writer& out) {
  write_keys(o.nodes, out);
}

void encode_fields(const remove_nodes_t& o, writer& out) {
  write_keys(o.nodes, out);
  write_flag(o.settle_rewards ? 1 : 0, out);
}

void encode_fields(const close_oracle_t& o, writer& out) {
  write_flag(static_cast<uint64_t>(o.disbursement), out);
}

void encode_fields(const add_funds_t& o, writer& out) {
  out.write_integer(o.amount);
}

void encode_fields(const create_reference_script_t&, writer&) {}

inline constexpr auto kFieldCounts =
    std::array<uint64_t, std::variant_size_v<action_payload_t>>{
        2, 1, 0, 1, 1, 1, 2, 1, 1, 0};

}  // namespace

void encode(const action_payload_t& o, writer& out) {
  auto fields = kFieldCounts[o.index()];
  begin_constr(out, o.index(), fields);
  std::visit([&](const auto& payload) { encode_fields(payload, out); }, o);
  end_list(out, fields);
}

void decode(action_payload_t& o, reader& in) {
  auto index = read_constr(in);
  if (index >= kFieldCounts.size()) {
    throw decode_error{
        fmt::format("redeemer: unknown constructor {}", index)};
  }
  auto fields = read_fields(in, kFieldCounts[index], kActionNames[index]);
  switch (index) {
    case 0: {
      auto payload = node_update_t{};
      payload.node = read_fixed_bytes<28>(in, "node_update node");
      payload.price = in.read_integer();
      o = payload;
      break;
    }
    case 1: {
      auto payload = node_collect_t{};
      payload.node = read_fixed_bytes<28>(in, "node_collect node");
      o = payload;
      break;
    }
    case 2:
      o = platform_collect_t{};
      break;
    case 3: {
      auto payload = aggregate_t{};
      payload.aggregator = read_fixed_bytes<28>(in, "aggregate aggregator");
      o = payload;
      break;
    }
    case 4: {
      auto payload = edit_settings_t{};
      decode(payload.settings, in);
      o = std::move(payload);
      break;
    }
    case 5: {
      auto payload = add_nodes_t{};
      payload.nodes = read_keys(in);
      o = std::move(payload);
      break;
    }
    case 6: {
      auto payload = remove_nodes_t{};
      payload.nodes = read_keys(in);
      payload.settle_rewards = read_flag(in, "settle_rewards") == 1;
      o = std::move(payload);
      break;
    }
    case 7: {
      auto payload = close_oracle_t{};
      payload.disbursement =
          static_cast<disbursement_t>(read_flag(in, "disbursement"));
      o = payload;
      break;
    }
    case 8: {
      auto payload = add_funds_t{};
      payload.amount = in.read_integer();
      o = payload;
      break;
    }
    default:
      o = create_reference_script_t{};
      break;
  }
  end_list(in, fields);
}

}  // namespace orca::schema::encoding::cbor
