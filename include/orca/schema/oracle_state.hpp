#pragma once

#include <orca/schema/lifecycle_status.hpp>
#include <orca/schema/node_entry.hpp>
#include <orca/schema/oracle_settings.hpp>
#include <orca/schema/price_data.hpp>
#include <orca/schema/primitives.hpp>

#include <optional>
#include <vector>

// Schema type: oracle state.
// The datum of the single UTxO marked by the state NFT. The fee-token reserve
// is not part of the datum; it is the fee-token quantity held by the UTxO
// minus every reward already allocated below.
namespace orca::schema {

template <uint16_t Version>
struct oracle_state;

template <>
struct oracle_state<1> final {
  uint16_t version{1};
  std::optional<price_data_t> price;
  std::vector<node_entry_t> nodes;
  oracle_settings_t settings;
  quantity_t platform_reward{};
  lifecycle_status_t status{lifecycle_status_t::active};

  bool operator==(const oracle_state&) const = default;
};

using oracle_state_t = oracle_state<1>;

/// Sum of node rewards plus the platform reward.
quantity_t allocated_rewards(const oracle_state_t& state);

const node_entry_t* find_node(const oracle_state_t& state,
                              const key_hash_t& operator_key);
node_entry_t* find_node(oracle_state_t& state, const key_hash_t& operator_key);

}  // namespace orca::schema
