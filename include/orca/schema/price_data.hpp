#pragma once

#include <orca/schema/primitives.hpp>

// Schema type: price data.
// Aggregated feed published by the last Aggregate transition.
namespace orca::schema {

template <uint16_t Version>
struct price_data;

template <>
struct price_data<1> final {
  uint16_t version{1};
  int64_t price{};
  timestamp_milliseconds_t timestamp{};
  timestamp_milliseconds_t expiry{};

  bool operator==(const price_data&) const = default;
};

using price_data_t = price_data<1>;

}  // namespace orca::schema
