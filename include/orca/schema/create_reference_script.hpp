#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: create reference script.
// Publish the validator as a reference script UTxO.
namespace orca::schema {

template <uint16_t Version>
struct create_reference_script;

template <>
struct create_reference_script<1> final {
  uint16_t version{1};

  bool operator==(const create_reference_script&) const = default;
};

using create_reference_script_t = create_reference_script<1>;

}  // namespace orca::schema
