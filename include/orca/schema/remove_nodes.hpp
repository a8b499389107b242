#pragma once

#include <orca/schema/primitives.hpp>

#include <vector>

// Schema type: remove nodes.
// Deregister node operators. With settle_rewards set, removed nodes are paid
// their unclaimed reward in the same transaction.
namespace orca::schema {

template <uint16_t Version>
struct remove_nodes;

template <>
struct remove_nodes<1> final {
  uint16_t version{1};
  std::vector<key_hash_t> nodes;
  bool settle_rewards{false};

  bool operator==(const remove_nodes&) const = default;
};

using remove_nodes_t = remove_nodes<1>;

}  // namespace orca::schema
