#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: node update.
// A node operator publishes its own price observation.
namespace orca::schema {

template <uint16_t Version>
struct node_update;

template <>
struct node_update<1> final {
  uint16_t version{1};
  key_hash_t node{};
  int64_t price{};

  bool operator==(const node_update&) const = default;
};

using node_update_t = node_update<1>;

}  // namespace orca::schema
