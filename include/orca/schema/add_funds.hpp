#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: add funds.
// Top up the fee-token reserve held by the state UTxO.
namespace orca::schema {

template <uint16_t Version>
struct add_funds;

template <>
struct add_funds<1> final {
  uint16_t version{1};
  quantity_t amount{};

  bool operator==(const add_funds&) const = default;
};

using add_funds_t = add_funds<1>;

}  // namespace orca::schema
