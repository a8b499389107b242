#pragma once

#include <orca/schema/action_request.hpp>
#include <orca/schema/oracle_state.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>

#include <optional>
#include <vector>

namespace orca::policy {

/// Chain facts a transition depends on beyond the datum itself.
struct transition_context_t final {
  orca::schema::timestamp_milliseconds_t now{};
  // Fee-token quantity held by the state UTxO.
  orca::schema::quantity_t fee_token_balance{};
  bool reference_script_exists{};
};

/// Fee tokens leaving the state UTxO for a key-hash address.
struct payout_t final {
  orca::schema::key_hash_t recipient{};
  orca::schema::quantity_t amount{};

  bool operator==(const payout_t&) const = default;
};

/// Everything the builder needs to realise one legal transition.
///
/// `next_state` is present whenever the state UTxO is spent and recreated.
/// Close sets `burn_state_token` instead; CreateReferenceScript leaves the
/// state UTxO untouched and sets neither.
struct transition_t final {
  std::optional<orca::schema::oracle_state_t> next_state;
  bool burn_state_token{};
  std::vector<orca::schema::key_hash_t> required_signers;  // sorted, unique
  std::vector<payout_t> payouts;
  // Fee tokens moved from the caller's wallet into the state UTxO.
  orca::schema::quantity_t funding{};
  // Lovelace still held by the state UTxO goes to the owner on Close.
  std::optional<orca::schema::key_hash_t> residual_recipient;

  bool operator==(const transition_t&) const = default;
};

/// Check every precondition of `request` against `state` and compute its
/// effect. Any violation is reported as illegal_transition, except a reserve
/// too small to pay an aggregation which is insufficient_funds.
orca::schema::result<transition_t> evaluate_transition(
    const orca::schema::oracle_state_t& state,
    const orca::schema::action_request_t& request,
    const transition_context_t& context);

/// Nodes whose feed counts toward the next aggregation at `now`.
std::vector<const orca::schema::node_entry_t*> fresh_nodes(
    const orca::schema::oracle_state_t& state,
    orca::schema::timestamp_milliseconds_t now);

}  // namespace orca::policy
