#include <orca/schema/oracle_state.hpp>

#include <algorithm>
#include <iterator>

namespace orca::schema {

quantity_t allocated_rewards(const oracle_state_t& state) {
  auto total = state.platform_reward;
  for (const auto& node : state.nodes) {
    total += node.reward;
  }
  return total;
}

const node_entry_t* find_node(const oracle_state_t& state,
                              const key_hash_t& operator_key) {
  auto it = std::ranges::find(state.nodes, operator_key,
                              &node_entry_t::operator_key);
  return it == std::end(state.nodes) ? nullptr : &*it;
}

node_entry_t* find_node(oracle_state_t& state, const key_hash_t& operator_key) {
  auto it = std::ranges::find(state.nodes, operator_key,
                              &node_entry_t::operator_key);
  return it == std::end(state.nodes) ? nullptr : &*it;
}

}  // namespace orca::schema
