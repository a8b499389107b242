#pragma once

#include <orca/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace orca::schema {

template <uint16_t Version>
struct slot_config;

template <>
struct slot_config<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t zero_time{};
  slot_t zero_slot{};
  duration_milliseconds_t slot_length{1000};

  bool operator==(const slot_config&) const = default;
};

using slot_config_t = slot_config<1>;

/// Known network presets: "mainnet", "preprod", "preview".
std::optional<slot_config_t> try_make_slot_config(std::string_view network);

timestamp_milliseconds_t slot_to_posix(const slot_config_t& config,
                                       slot_t slot);

/// Slots before `zero_time` clamp to `zero_slot`.
slot_t posix_to_slot(const slot_config_t& config,
                     timestamp_milliseconds_t time);

}  // namespace orca::schema
