#pragma once

#include <orca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace orca::schema {

enum class lifecycle_status_t : uint8_t { active = 0, closed = 1 };

inline constexpr auto kLifecycleStatusMappings =
    enum_mappings_t<lifecycle_status_t, 2>{
        {{"active", lifecycle_status_t::active},
         {"closed", lifecycle_status_t::closed}}};

template <>
inline std::optional<lifecycle_status_t> try_from_string<lifecycle_status_t>(
    const std::string_view value) {
  return from_string(value, kLifecycleStatusMappings);
}

inline constexpr std::string_view to_string(const lifecycle_status_t value) {
  return to_string(value, kLifecycleStatusMappings, "unknown");
}

}  // namespace orca::schema
