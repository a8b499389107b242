#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: aggregate.
// Fold fresh node feeds into a new canonical price.
namespace orca::schema {

template <uint16_t Version>
struct aggregate;

template <>
struct aggregate<1> final {
  uint16_t version{1};
  key_hash_t aggregator{};

  bool operator==(const aggregate&) const = default;
};

using aggregate_t = aggregate<1>;

}  // namespace orca::schema
