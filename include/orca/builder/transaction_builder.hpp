#pragma once

#include <orca/chain/chain_query.hpp>
#include <orca/policy/state_machine.hpp>
#include <orca/schema/action_request.hpp>
#include <orca/schema/oracle_config.hpp>
#include <orca/schema/oracle_state.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/transaction.hpp>
#include <orca/selection/coin_selector.hpp>

#include <optional>
#include <vector>

namespace orca::builder {

/// Upper bound on fee re-estimation rounds before giving up.
inline constexpr auto kMaxFeeIterations = 8;

struct built_transaction_t final {
  orca::schema::transaction_t transaction;  // no vkey witnesses yet
  orca::schema::bytes_t bytes;
  orca::schema::tx_id_t tx_id{};
  // Every key whose witness the ledger or validator will demand, sorted.
  std::vector<orca::schema::key_hash_t> required_signers;
  std::optional<orca::schema::oracle_state_t> next_state;
};

/// Turns one validated action into a balanced, unsigned Babbage transaction.
///
/// The builder is pure over its inputs: the same snapshot and request always
/// produce byte-identical output. It fails with illegal_transition before it
/// touches the coin selector.
class transaction_builder final {
 public:
  explicit transaction_builder(
      orca::schema::oracle_config_t config,
      orca::selection::coin_selector_t selector =
          orca::selection::select_largest_first);

  /// Resolve a fresh snapshot for `wallet_address` and build from it.
  orca::schema::result<built_transaction_t> build(
      orca::chain::chain_query& query,
      const orca::schema::bytes_view_t& wallet_address,
      const orca::schema::action_request_t& request) const;

  orca::schema::result<built_transaction_t> build(
      const orca::chain::chain_snapshot_t& snapshot,
      const orca::schema::action_request_t& request) const;

 private:
  orca::schema::oracle_config_t config_;
  orca::selection::coin_selector_t selector_;
};

/// ceil(memory * price_memory) + ceil(steps * price_steps).
orca::schema::lovelace_t execution_cost(
    const orca::schema::ex_units_t& units,
    const orca::schema::protocol_parameters_t& parameters);

/// Collateral the ledger demands for a script transaction paying `fee`.
orca::schema::lovelace_t required_collateral(
    orca::schema::lovelace_t fee,
    orca::schema::lovelace_t configured_minimum,
    const orca::schema::protocol_parameters_t& parameters);

}  // namespace orca::builder
