#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: node collect.
// A node operator withdraws its accumulated reward.
namespace orca::schema {

template <uint16_t Version>
struct node_collect;

template <>
struct node_collect<1> final {
  uint16_t version{1};
  key_hash_t node{};

  bool operator==(const node_collect&) const = default;
};

using node_collect_t = node_collect<1>;

}  // namespace orca::schema
