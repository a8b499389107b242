#pragma once

#include <orca/builder/transaction_builder.hpp>
#include <orca/chain/chain_query.hpp>
#include <orca/codec/state_codec.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/action_request.hpp>
#include <orca/schema/address.hpp>
#include <orca/submission/submission_gate.hpp>
#include <orca/testing/common.hpp>
#include <orca/testing/memory_ledger.hpp>

#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace orca::testing {

inline constexpr auto kNodeCount = std::size_t{5};
inline constexpr auto kInitialReserve = orca::schema::quantity_t{10'000};

inline orca::schema::asset_id_t make_fee_token() {
  return orca::schema::asset_id_t{.policy_id = make_key_hash(0xf0),
                                  .asset_name = orca::schema::make_bytes(
                                      std::string_view{"FEE"})};
}

inline orca::schema::oracle_config_t make_oracle_config(
    const orca::schema::key_hash_t& owner) {
  auto config = orca::schema::oracle_config_t{};
  config.network = orca::schema::network_t::testnet;
  config.validator_script =
      orca::schema::make_bytes(std::string_view{"orca oracle validator"});
  config.minting_policy_script =
      orca::schema::make_bytes(std::string_view{"orca state nft policy"});
  config.oracle_address = orca::schema::make_script_address(
      config.network, orca::hash::plutus_v2_script_hash(
                          orca::schema::make_bytes_view(
                              config.validator_script)));
  config.state_nft = orca::schema::asset_id_t{
      .policy_id = orca::hash::plutus_v2_script_hash(
          orca::schema::make_bytes_view(config.minting_policy_script)),
      .asset_name = orca::schema::make_bytes(std::string_view{"ORCA"})};
  config.reference_script_address =
      orca::schema::make_enterprise_address(config.network, owner);
  return config;
}

/// Deployed oracle on a memory ledger: an owner, two platform signers with
/// threshold one, five registered nodes (minimum three) and funded wallets.
class oracle_fixture final {
 public:
  oracle_fixture()
      : owner_{make_signing_key(1)},
        platform_{make_signing_key(2), make_signing_key(3)},
        outsider_{make_signing_key(40)},
        config_{make_oracle_config(owner_.key_hash)},
        query_{ledger_, config_},
        builder_{config_},
        gate_{ledger_} {
    for (std::size_t i = 0; i < kNodeCount; ++i) {
      nodes_.push_back(make_signing_key(static_cast<uint8_t>(10 + i)));
    }
    for (const auto& key : all_keys()) {
      keys_.emplace(key.key_hash, key);
      fund(key, 100'000'000);
      fund(key, 30'000'000);
    }
    state_reference_ = ledger_.add_utxo(initial_state_output());
  }

  oracle_fixture(const oracle_fixture&) = delete;
  oracle_fixture& operator=(const oracle_fixture&) = delete;

  memory_ledger& ledger() { return ledger_; }
  orca::chain::chain_query& query() { return query_; }
  const orca::builder::transaction_builder& builder() const {
    return builder_;
  }
  orca::submission::submission_gate& gate() { return gate_; }
  const orca::schema::oracle_config_t& config() const { return config_; }

  const signing_key_t& owner() const { return owner_; }
  const signing_key_t& platform(const std::size_t i) const {
    return platform_.at(i);
  }
  const signing_key_t& node(const std::size_t i) const { return nodes_.at(i); }
  const signing_key_t& outsider() const { return outsider_; }
  const orca::schema::output_reference_t& initial_state_reference() const {
    return state_reference_;
  }

  orca::schema::bytes_t wallet(const signing_key_t& key) const {
    return orca::schema::make_enterprise_address(config_.network,
                                                 key.key_hash);
  }

  orca::schema::oracle_settings_t make_settings() const {
    auto settings = orca::schema::oracle_settings_t{};
    settings.owner = owner_.key_hash;
    settings.min_nodes = 3;
    settings.node_staleness = 300'000;
    settings.aggregate_time = 600'000;
    settings.aggregate_change = 100;
    settings.rewards = orca::schema::price_rewards_t{
        .node_fee = 10, .aggregate_fee = 5, .platform_fee = 3};
    settings.iqr_multiplier = 2;
    settings.divergence = 1000;
    settings.platform = orca::schema::platform_t{
        .signers = {platform_[0].key_hash, platform_[1].key_hash},
        .threshold = 1};
    settings.fee_token = make_fee_token();
    return settings;
  }

  orca::schema::oracle_state_t make_initial_state() const {
    auto state = orca::schema::oracle_state_t{};
    state.settings = make_settings();
    for (const auto& node : nodes_) {
      state.nodes.push_back(
          orca::schema::node_entry_t{.operator_key = node.key_hash});
    }
    return state;
  }

  orca::schema::action_request_t request(
      const signing_key_t& caller,
      orca::schema::action_payload_t payload) const {
    auto out = orca::schema::action_request_t{};
    out.caller = caller.key_hash;
    out.payload = std::move(payload);
    return out;
  }

  /// Owner request co-signed by the first platform signer.
  orca::schema::action_request_t owner_request(
      orca::schema::action_payload_t payload) const {
    auto out = request(owner_, std::move(payload));
    out.platform_signers = {platform_[0].key_hash};
    return out;
  }

  orca::schema::result<orca::builder::built_transaction_t> build(
      const signing_key_t& submitter,
      const orca::schema::action_request_t& request) {
    auto address = wallet(submitter);
    return builder_.build(query_, orca::schema::make_bytes_view(address),
                          request);
  }

  /// Witness `built` with every required signer's key.
  orca::schema::bytes_t sign(const orca::builder::built_transaction_t& built)
      const {
    auto tx = built.transaction;
    for (const auto& signer : built.required_signers) {
      auto it = keys_.find(signer);
      if (it == std::end(keys_)) {
        throw std::runtime_error{"no key for required signer " +
                                 orca::schema::to_hex(signer)};
      }
      tx.witnesses.vkey_witnesses.push_back(
          make_witness(it->second, built.tx_id));
    }
    return orca::codec::encode_transaction(tx);
  }

  /// Build, sign and submit in one go.
  orca::schema::result<orca::schema::tx_id_t> execute(
      const signing_key_t& submitter,
      const orca::schema::action_request_t& request) {
    auto built = build(submitter, request);
    if (!built) {
      return orca::schema::forward_error<orca::schema::tx_id_t>(built);
    }
    auto signed_tx = sign(*built);
    return gate_.submit(orca::schema::make_bytes_view(signed_tx));
  }

  orca::schema::result<orca::schema::tx_id_t> update_price(
      const std::size_t node_index,
      const int64_t price) {
    const auto& key = node(node_index);
    return execute(key, request(key, orca::schema::node_update_t{
                                         .node = key.key_hash,
                                         .price = price}));
  }

  orca::schema::oracle_state_t state() {
    auto resolved = query_.resolve_state();
    if (!resolved) {
      throw std::runtime_error{"oracle state did not resolve: " +
                               resolved.log};
    }
    return resolved->state;
  }

  orca::schema::quantity_t reserve_balance() {
    auto resolved = query_.resolve_state();
    if (!resolved) {
      throw std::runtime_error{"oracle state did not resolve: " +
                               resolved.log};
    }
    return orca::schema::quantity_of(resolved->utxo.output.value,
                                     make_fee_token());
  }

  orca::schema::quantity_t fee_tokens_held(const signing_key_t& key) {
    auto address = wallet(key);
    auto utxos = ledger_.utxos_at(orca::schema::make_bytes_view(address));
    auto total = orca::schema::quantity_t{};
    for (const auto& utxo : *utxos) {
      total += orca::schema::quantity_of(utxo.output.value, make_fee_token());
    }
    return total;
  }

  void fund(const signing_key_t& key, const orca::schema::lovelace_t coin) {
    ledger_.add_utxo(orca::schema::transaction_output_t{
        .address = wallet(key), .value = orca::schema::make_value(coin)});
  }

  void fund_fee_tokens(const signing_key_t& key,
                       const orca::schema::quantity_t amount) {
    ledger_.add_utxo(orca::schema::transaction_output_t{
        .address = wallet(key),
        .value = orca::schema::make_value(2'000'000, make_fee_token(),
                                          amount)});
  }

 private:
  std::vector<signing_key_t> all_keys() const {
    auto keys = std::vector<signing_key_t>{owner_, outsider_};
    keys.insert(std::end(keys), std::begin(platform_), std::end(platform_));
    keys.insert(std::end(keys), std::begin(nodes_), std::end(nodes_));
    return keys;
  }

  orca::schema::transaction_output_t initial_state_output() const {
    auto value = orca::schema::make_value(10'000'000, config_.state_nft, 1);
    orca::schema::adjust_asset(value, make_fee_token(), kInitialReserve);
    return orca::schema::transaction_output_t{
        .address = config_.oracle_address,
        .value = std::move(value),
        .datum = orca::codec::encode_state(make_initial_state())};
  }

  memory_ledger ledger_;
  signing_key_t owner_;
  std::vector<signing_key_t> platform_;
  signing_key_t outsider_;
  std::vector<signing_key_t> nodes_;
  std::map<orca::schema::key_hash_t, signing_key_t> keys_;
  orca::schema::oracle_config_t config_;
  orca::chain::chain_query query_;
  orca::builder::transaction_builder builder_;
  orca::submission::submission_gate gate_;
  orca::schema::output_reference_t state_reference_;
};

}  // namespace orca::testing
