#include <orca/schema/slot_config.hpp>

#include <array>
#include <utility>

namespace orca::schema {

namespace {

inline constexpr auto kSlotConfigPresets =
    std::array<std::pair<std::string_view, slot_config_t>, 3>{
        {{"mainnet",
          slot_config_t{.zero_time = 1'596'059'091'000,
                        .zero_slot = 4'492'800,
                        .slot_length = 1000}},
         {"preprod",
          slot_config_t{.zero_time = 1'655'769'600'000,
                        .zero_slot = 86'400,
                        .slot_length = 1000}},
         {"preview", slot_config_t{.zero_time = 1'666'656'000'000,
                                   .zero_slot = 0,
                                   .slot_length = 1000}}}};

}  // namespace

std::optional<slot_config_t> try_make_slot_config(
    const std::string_view network) {
  for (const auto& [name, config] : kSlotConfigPresets) {
    if (name == network) {
      return config;
    }
  }
  return std::nullopt;
}

timestamp_milliseconds_t slot_to_posix(const slot_config_t& config,
                                       const slot_t slot) {
  if (slot < config.zero_slot) {
    return config.zero_time;
  }
  return config.zero_time + ((slot - config.zero_slot) * config.slot_length);
}

slot_t posix_to_slot(const slot_config_t& config,
                     const timestamp_milliseconds_t time) {
  if (time < config.zero_time || config.slot_length == 0) {
    return config.zero_slot;
  }
  return config.zero_slot + ((time - config.zero_time) / config.slot_length);
}

}  // namespace orca::schema
