#include <boost/program_options.hpp>
#include <orca/codec/state_codec.hpp>
#include <orca/common/critical.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/action_request.hpp>
#include <orca/schema/oracle_state.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

orca::schema::bytes_t get_hex(const po::variables_map& vm,
                              const std::string& name) {
  if (!vm.contains(name)) {
    orca::common::critical(fmt::format("missing required --{}", name));
  }
  auto decoded = orca::schema::try_from_hex(vm[name].as<std::string>());
  if (!decoded) {
    orca::common::critical(fmt::format("--{} is not valid hex", name));
  }
  return *decoded;
}

orca::schema::key_hash_t parse_key_hash(const std::string& hex) {
  auto key = orca::schema::try_make_hash28(hex);
  if (!key) {
    orca::common::critical("key hash must be 28 bytes of hex");
  }
  return *key;
}

orca::schema::key_hash_t get_key_hash(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    orca::common::critical(fmt::format("missing required --{}", name));
  }
  return parse_key_hash(vm[name].as<std::string>());
}

std::vector<orca::schema::key_hash_t> get_key_hashes(
    const po::variables_map& vm,
    const std::string& name) {
  auto out = std::vector<orca::schema::key_hash_t>{};
  if (!vm.contains(name)) {
    return out;
  }
  for (const auto& hex : vm[name].as<std::vector<std::string>>()) {
    out.push_back(parse_key_hash(hex));
  }
  return out;
}

orca::schema::oracle_settings_t build_settings(const po::variables_map& vm) {
  auto settings = orca::schema::oracle_settings_t{};
  settings.owner = get_key_hash(vm, "owner");
  settings.min_nodes = vm["min-nodes"].as<uint32_t>();
  settings.node_staleness = vm["node-staleness"].as<uint64_t>();
  settings.aggregate_time = vm["aggregate-time"].as<uint64_t>();
  settings.aggregate_change = vm["aggregate-change"].as<uint32_t>();
  settings.rewards.node_fee = vm["node-fee"].as<int64_t>();
  settings.rewards.aggregate_fee = vm["aggregate-fee"].as<int64_t>();
  settings.rewards.platform_fee = vm["platform-fee"].as<int64_t>();
  settings.iqr_multiplier = vm["iqr-multiplier"].as<uint32_t>();
  settings.divergence = vm["divergence"].as<uint32_t>();
  settings.platform.signers = get_key_hashes(vm, "platform-signer");
  settings.platform.threshold = vm["platform-threshold"].as<uint32_t>();
  auto policy = orca::schema::try_make_hash28(
      vm["fee-token-policy"].as<std::string>());
  if (!policy) {
    orca::common::critical("--fee-token-policy must be 28 bytes of hex");
  }
  settings.fee_token.policy_id = *policy;
  settings.fee_token.asset_name = get_hex(vm, "fee-token-name");
  if (auto violation = orca::codec::settings_violation(settings)) {
    orca::common::critical(fmt::format("invalid settings: {}", *violation));
  }
  return settings;
}

orca::schema::action_payload_t build_payload(const po::variables_map& vm) {
  if (!vm.contains("action")) {
    orca::common::critical("redeemer mode requires --action");
  }
  auto action = vm["action"].as<std::string>();
  if (action == "node_update") {
    return orca::schema::node_update_t{.node = get_key_hash(vm, "node"),
                                       .price = vm["price"].as<int64_t>()};
  }
  if (action == "node_collect") {
    return orca::schema::node_collect_t{.node = get_key_hash(vm, "node")};
  }
  if (action == "platform_collect") {
    return orca::schema::platform_collect_t{};
  }
  if (action == "aggregate") {
    return orca::schema::aggregate_t{.aggregator = get_key_hash(vm, "node")};
  }
  if (action == "edit_settings") {
    return orca::schema::edit_settings_t{.settings = build_settings(vm)};
  }
  if (action == "add_nodes") {
    return orca::schema::add_nodes_t{.nodes = get_key_hashes(vm, "nodes")};
  }
  if (action == "remove_nodes") {
    return orca::schema::remove_nodes_t{
        .nodes = get_key_hashes(vm, "nodes"),
        .settle_rewards = vm.contains("settle-rewards")};
  }
  if (action == "close") {
    auto disbursement = orca::schema::try_from_string<
        orca::schema::disbursement_t>(vm["disbursement"].as<std::string>());
    if (!disbursement) {
      orca::common::critical("--disbursement must be to_nodes|to_owner");
    }
    return orca::schema::close_oracle_t{.disbursement = *disbursement};
  }
  if (action == "add_funds") {
    return orca::schema::add_funds_t{.amount = vm["amount"].as<int64_t>()};
  }
  if (action == "create_reference_script") {
    return orca::schema::create_reference_script_t{};
  }
  orca::common::critical(fmt::format("unsupported action '{}'", action));
}

void print_state(const orca::schema::oracle_state_t& state) {
  std::cout << "status: " << orca::schema::to_string(state.status) << '\n';
  if (state.price) {
    std::cout << "price: " << state.price->price << " at "
              << state.price->timestamp << " until " << state.price->expiry
              << '\n';
  } else {
    std::cout << "price: none\n";
  }
  std::cout << "owner: " << orca::schema::to_hex(state.settings.owner)
            << '\n';
  std::cout << "platform_reward: " << state.platform_reward << '\n';
  for (const auto& node : state.nodes) {
    std::cout << "node " << orca::schema::to_hex(node.operator_key)
              << " reward " << node.reward;
    if (node.feed) {
      std::cout << " feed " << node.feed->value << " at "
                << node.feed->last_update;
    }
    std::cout << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  orca_transaction_builder redeemer --action <name> [options]\n"
            << "  orca_transaction_builder decode-redeemer --hex <cbor>\n"
            << "  orca_transaction_builder datum [settings options]\n"
            << "  orca_transaction_builder decode-datum --hex <cbor>\n"
            << "  orca_transaction_builder tx-id --hex <transaction cbor>\n"
            << "  orca_transaction_builder key-hash --hex <vkey>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"orca_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "redeemer|decode-redeemer|datum|decode-datum|tx-id|key-hash")(
      "hex", po::value<std::string>(), "input bytes as hex")(
      "action", po::value<std::string>(), "oracle action name")(
      "node", po::value<std::string>(), "node key hash hex")(
      "nodes", po::value<std::vector<std::string>>()->multitoken(),
      "node key hashes hex")("price", po::value<int64_t>()->default_value(0),
                             "node price feed")(
      "amount", po::value<int64_t>()->default_value(0), "fee tokens to add")(
      "settle-rewards", "pay removed nodes their rewards")(
      "disbursement", po::value<std::string>()->default_value("to_nodes"),
      "to_nodes|to_owner")("owner", po::value<std::string>(),
                           "owner key hash hex")(
      "min-nodes", po::value<uint32_t>()->default_value(1),
      "minimum fresh feeds per aggregate")(
      "node-staleness", po::value<uint64_t>()->default_value(3'600'000),
      "feed validity in ms")(
      "aggregate-time", po::value<uint64_t>()->default_value(3'600'000),
      "aggregate validity in ms")(
      "aggregate-change", po::value<uint32_t>()->default_value(100),
      "basis points that make an aggregate due")(
      "node-fee", po::value<int64_t>()->default_value(0), "per-node reward")(
      "aggregate-fee", po::value<int64_t>()->default_value(0),
      "aggregator reward")("platform-fee", po::value<int64_t>()->default_value(0),
                           "platform reward")(
      "iqr-multiplier", po::value<uint32_t>()->default_value(2),
      "IQR multiplier k")(
      "divergence", po::value<uint32_t>()->default_value(1500),
      "allowed divergence in basis points")(
      "platform-signer", po::value<std::vector<std::string>>()->multitoken(),
      "platform key hashes hex")(
      "platform-threshold", po::value<uint32_t>()->default_value(0),
      "platform signatures required")(
      "fee-token-policy",
      po::value<std::string>()->default_value(std::string(56, '0')),
      "fee token policy id hex")(
      "fee-token-name", po::value<std::string>()->default_value(""),
      "fee token asset name hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "redeemer") {
    auto encoded = orca::codec::encode_redeemer(build_payload(vm));
    std::cout << orca::schema::to_hex(encoded) << '\n';
    return 0;
  }

  if (command == "decode-redeemer") {
    auto bytes = get_hex(vm, "hex");
    auto payload =
        orca::codec::decode_redeemer(orca::schema::make_bytes_view(bytes));
    if (!payload) {
      std::cerr << payload.log << ": " << payload.info << '\n';
      return 1;
    }
    std::cout << orca::schema::action_name(*payload) << '\n';
    return 0;
  }

  if (command == "datum") {
    auto state = orca::schema::oracle_state_t{};
    state.settings = build_settings(vm);
    for (const auto& key : get_key_hashes(vm, "nodes")) {
      state.nodes.push_back(orca::schema::node_entry_t{.operator_key = key});
    }
    std::cout << orca::schema::to_hex(orca::codec::encode_state(state))
              << '\n';
    return 0;
  }

  if (command == "decode-datum") {
    auto bytes = get_hex(vm, "hex");
    auto state =
        orca::codec::decode_state(orca::schema::make_bytes_view(bytes));
    if (!state) {
      std::cerr << state.log << ": " << state.info << '\n';
      return 1;
    }
    print_state(*state);
    return 0;
  }

  if (command == "tx-id") {
    auto bytes = get_hex(vm, "hex");
    auto tx =
        orca::codec::decode_transaction(orca::schema::make_bytes_view(bytes));
    if (!tx) {
      std::cerr << tx.log << ": " << tx.info << '\n';
      return 1;
    }
    std::cout << orca::schema::to_hex(orca::codec::transaction_id(tx->body))
              << '\n';
    return 0;
  }

  if (command == "key-hash") {
    auto bytes = get_hex(vm, "hex");
    if (bytes.size() != 32) {
      orca::common::critical("verification key must be 32 bytes");
    }
    auto vkey = orca::schema::ed25519_public_key_t{};
    std::copy(std::begin(bytes), std::end(bytes), std::begin(vkey));
    std::cout << orca::schema::to_hex(orca::hash::key_hash(vkey)) << '\n';
    return 0;
  }

  orca::common::critical(
      "command must be "
      "redeemer|decode-redeemer|datum|decode-datum|tx-id|key-hash");
}
