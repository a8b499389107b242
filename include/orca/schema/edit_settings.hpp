#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/oracle_settings.hpp>

// Schema type: edit settings.
// Replace the settings record atomically.
namespace orca::schema {

template <uint16_t Version>
struct edit_settings;

template <>
struct edit_settings<1> final {
  uint16_t version{1};
  oracle_settings_t settings;

  bool operator==(const edit_settings&) const = default;
};

using edit_settings_t = edit_settings<1>;

}  // namespace orca::schema
