#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: platform collect.
// The owner withdraws the accumulated platform reward.
namespace orca::schema {

template <uint16_t Version>
struct platform_collect;

template <>
struct platform_collect<1> final {
  uint16_t version{1};

  bool operator==(const platform_collect&) const = default;
};

using platform_collect_t = platform_collect<1>;

}  // namespace orca::schema
