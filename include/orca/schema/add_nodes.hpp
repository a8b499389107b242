#pragma once

#include <orca/schema/primitives.hpp>

#include <vector>

// Schema type: add nodes.
// Register new node operators with empty feeds and zero reward.
namespace orca::schema {

template <uint16_t Version>
struct add_nodes;

template <>
struct add_nodes<1> final {
  uint16_t version{1};
  std::vector<key_hash_t> nodes;

  bool operator==(const add_nodes&) const = default;
};

using add_nodes_t = add_nodes<1>;

}  // namespace orca::schema
