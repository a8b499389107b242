#pragma once

#include <orca/schema/disbursement.hpp>
#include <orca/schema/primitives.hpp>

// Schema type: close oracle.
// Burn the state NFT and return every locked fund.
namespace orca::schema {

template <uint16_t Version>
struct close_oracle;

template <>
struct close_oracle<1> final {
  uint16_t version{1};
  disbursement_t disbursement{disbursement_t::to_nodes};

  bool operator==(const close_oracle&) const = default;
};

using close_oracle_t = close_oracle<1>;

}  // namespace orca::schema
