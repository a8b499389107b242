#include <orca/chain/chain_query.hpp>
#include <orca/codec/state_codec.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace orca::schema;

namespace orca::chain {

namespace {

void sort_by_reference(std::vector<utxo_t>& utxos) {
  std::sort(std::begin(utxos), std::end(utxos),
            [](const utxo_t& lhs, const utxo_t& rhs) {
              return lhs.input < rhs.input;
            });
}

}  // namespace

chain_query::chain_query(chain_backend& backend, oracle_config_t config)
    : backend_(backend), config_(std::move(config)) {}

result<std::vector<utxo_t>> chain_query::resolve_utxos(
    const bytes_view_t& address,
    const std::optional<asset_id_t>& asset_filter) {
  auto fetched = backend_.utxos_at(address);
  if (!fetched) {
    spdlog::error("Failed to fetch UTxOs at {}: {}", to_hex(address),
                  fetched.log);
    return fetched;
  }
  auto utxos = std::move(*fetched);
  if (asset_filter) {
    std::erase_if(utxos, [&](const utxo_t& utxo) {
      return quantity_of(utxo.output.value, *asset_filter) <= 0;
    });
  }
  sort_by_reference(utxos);
  return make_result(std::move(utxos));
}

result<state_view_t> chain_query::resolve_state() {
  auto candidates = resolve_utxos(make_bytes_view(config_.oracle_address),
                                  config_.state_nft);
  if (!candidates) {
    return forward_error<state_view_t>(candidates);
  }
  if (candidates->empty()) {
    return make_error<state_view_t>(error_code::state_not_found,
                                    "no UTxO carries the state NFT",
                                    to_hex(config_.oracle_address));
  }
  if (candidates->size() > 1) {
    auto references = std::string{};
    for (const auto& utxo : *candidates) {
      if (!references.empty()) {
        references += ",";
      }
      references += to_string(utxo.input);
    }
    spdlog::error("State NFT found in {} UTxOs: {}", candidates->size(),
                  references);
    return make_error<state_view_t>(error_code::ambiguous_state,
                                    "several UTxOs carry the state NFT",
                                    references);
  }

  auto& utxo = candidates->front();
  if (!utxo.output.datum) {
    return make_error<state_view_t>(error_code::schema_mismatch,
                                    "state UTxO has no inline datum",
                                    to_string(utxo.input));
  }
  auto state = orca::codec::decode_state(make_bytes_view(*utxo.output.datum));
  if (!state) {
    return forward_error<state_view_t>(state);
  }
  spdlog::debug("Resolved oracle state at {}", to_string(utxo.input));
  return make_result(
      state_view_t{.utxo = std::move(utxo), .state = std::move(*state)});
}

result<std::optional<utxo_t>> chain_query::resolve_reference_script() {
  auto utxos =
      resolve_utxos(make_bytes_view(config_.reference_script_address));
  if (!utxos) {
    return forward_error<std::optional<utxo_t>>(utxos);
  }
  // Ordered by reference, so the first match is stable across calls.
  for (auto& utxo : *utxos) {
    if (utxo.output.reference_script &&
        *utxo.output.reference_script == config_.validator_script) {
      return make_result(std::optional<utxo_t>{std::move(utxo)});
    }
  }
  return make_result(std::optional<utxo_t>{});
}

result<std::vector<utxo_t>> chain_query::resolve_inputs(
    const std::vector<output_reference_t>& references) {
  auto fetched = backend_.utxos_by_reference(references);
  if (!fetched) {
    return fetched;
  }
  sort_by_reference(*fetched);
  return fetched;
}

result<slot_t> chain_query::current_slot() {
  return backend_.tip();
}

slot_config_t chain_query::slot_config() const {
  return backend_.slot_config();
}

result<chain_snapshot_t> chain_query::resolve_snapshot(
    const bytes_view_t& wallet_address) {
  auto snapshot = chain_snapshot_t{};

  auto oracle = resolve_state();
  if (!oracle) {
    return forward_error<chain_snapshot_t>(oracle);
  }
  snapshot.oracle = std::move(*oracle);

  auto reference = resolve_reference_script();
  if (!reference) {
    return forward_error<chain_snapshot_t>(reference);
  }
  snapshot.reference_script = std::move(*reference);

  auto wallet = resolve_utxos(wallet_address);
  if (!wallet) {
    return forward_error<chain_snapshot_t>(wallet);
  }
  snapshot.wallet_address = make_bytes(wallet_address);
  snapshot.wallet_utxos = std::move(*wallet);

  auto tip = backend_.tip();
  if (!tip) {
    return forward_error<chain_snapshot_t>(tip);
  }
  auto parameters = backend_.protocol_parameters();
  if (!parameters) {
    return forward_error<chain_snapshot_t>(parameters);
  }
  snapshot.tip = *tip;
  snapshot.slot_config = backend_.slot_config();
  snapshot.now = slot_to_posix(snapshot.slot_config, snapshot.tip);
  snapshot.parameters = std::move(*parameters);

  spdlog::info(
      "Snapshot at slot {}: state {}, reference script {}, {} wallet UTxO(s)",
      snapshot.tip, to_string(snapshot.oracle.utxo.input),
      snapshot.reference_script ? to_string(snapshot.reference_script->input)
                                : std::string{"none"},
      snapshot.wallet_utxos.size());
  return make_result(std::move(snapshot));
}

}  // namespace orca::chain
