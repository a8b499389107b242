#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/value.hpp>

#include <vector>

// Schema type: oracle settings.
// Aggregation parameters, fees and administrative credentials.
namespace orca::schema {

/// Basis-point resolution used by aggregate_change and divergence.
inline constexpr int64_t kFactorResolution = 10000;

struct price_rewards_t final {
  quantity_t node_fee{};
  quantity_t aggregate_fee{};
  quantity_t platform_fee{};

  bool operator==(const price_rewards_t&) const = default;
};

/// Platform multisig: any `threshold` of `signers` co-sign owner actions.
struct platform_t final {
  std::vector<key_hash_t> signers;
  uint32_t threshold{};

  bool operator==(const platform_t&) const = default;
};

template <uint16_t Version>
struct oracle_settings;

template <>
struct oracle_settings<1> final {
  uint16_t version{1};
  key_hash_t owner{};
  uint32_t min_nodes{};
  duration_milliseconds_t node_staleness{};
  duration_milliseconds_t aggregate_time{};
  uint32_t aggregate_change{};  // basis points
  price_rewards_t rewards;
  uint32_t iqr_multiplier{};  // k in q1 - k*iqr, q3 + k*iqr
  uint32_t divergence{};      // basis points
  platform_t platform;
  asset_id_t fee_token;

  bool operator==(const oracle_settings&) const = default;
};

using oracle_settings_t = oracle_settings<1>;

}  // namespace orca::schema
