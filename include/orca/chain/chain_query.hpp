#pragma once

#include <orca/chain/chain_backend.hpp>
#include <orca/schema/oracle_config.hpp>
#include <orca/schema/oracle_state.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/protocol_parameters.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/slot_config.hpp>
#include <orca/schema/utxo.hpp>
#include <orca/schema/value.hpp>

#include <optional>
#include <vector>

namespace orca::chain {

struct state_view_t final {
  orca::schema::utxo_t utxo;
  orca::schema::oracle_state_t state;

  bool operator==(const state_view_t&) const = default;
};

/// Everything one flow reads from the chain, taken together. Builders work
/// from a snapshot and never query again; a flow that submitted anything
/// resolves a new one.
struct chain_snapshot_t final {
  state_view_t oracle;
  std::optional<orca::schema::utxo_t> reference_script;
  orca::schema::bytes_t wallet_address;
  std::vector<orca::schema::utxo_t> wallet_utxos;
  orca::schema::slot_t tip{};
  orca::schema::timestamp_milliseconds_t now{};
  orca::schema::protocol_parameters_t parameters;
  orca::schema::slot_config_t slot_config;
};

/// Typed, read-only view of the oracle on chain.
class chain_query final {
 public:
  chain_query(chain_backend& backend, orca::schema::oracle_config_t config);

  /// UTxOs at `address`, optionally restricted to those holding
  /// `asset_filter`, ordered by output reference.
  orca::schema::result<std::vector<orca::schema::utxo_t>> resolve_utxos(
      const orca::schema::bytes_view_t& address,
      const std::optional<orca::schema::asset_id_t>& asset_filter =
          std::nullopt);

  /// The single UTxO carrying the state NFT, decoded. state_not_found when
  /// none exists, ambiguous_state (listing the references) when several do.
  orca::schema::result<state_view_t> resolve_state();

  orca::schema::result<std::optional<orca::schema::utxo_t>>
  resolve_reference_script();

  orca::schema::result<std::vector<orca::schema::utxo_t>> resolve_inputs(
      const std::vector<orca::schema::output_reference_t>& references);

  orca::schema::result<orca::schema::slot_t> current_slot();

  orca::schema::result<chain_snapshot_t> resolve_snapshot(
      const orca::schema::bytes_view_t& wallet_address);

  const orca::schema::oracle_config_t& config() const { return config_; }
  orca::schema::slot_config_t slot_config() const;

 private:
  chain_backend& backend_;
  orca::schema::oracle_config_t config_;
};

}  // namespace orca::chain
