#pragma once

#include <orca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Error taxonomy shared by every component. Codes are stable on the wire of
// the signing tools, so never renumber an existing entry.
namespace orca::schema {

enum class error_code : uint32_t {
  ok = 0,
  // policy
  illegal_transition = 1,
  // resource
  insufficient_funds = 10,
  state_not_found = 11,
  ambiguous_state = 12,
  // schema
  schema_mismatch = 20,
  // coordination
  unexpected_signer = 30,
  stale_transaction = 31,
  session_not_found = 32,
  invalid_witness = 33,
  // building
  fee_estimation_failed = 40,
  // submission
  network_error = 50,
  rejected = 51
};

inline constexpr auto kErrorCodeMappings = enum_mappings_t<error_code, 13>{
    {{"ok", error_code::ok},
     {"illegal_transition", error_code::illegal_transition},
     {"insufficient_funds", error_code::insufficient_funds},
     {"state_not_found", error_code::state_not_found},
     {"ambiguous_state", error_code::ambiguous_state},
     {"schema_mismatch", error_code::schema_mismatch},
     {"unexpected_signer", error_code::unexpected_signer},
     {"stale_transaction", error_code::stale_transaction},
     {"session_not_found", error_code::session_not_found},
     {"invalid_witness", error_code::invalid_witness},
     {"fee_estimation_failed", error_code::fee_estimation_failed},
     {"network_error", error_code::network_error},
     {"rejected", error_code::rejected}}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings, "unknown");
}

inline constexpr std::string_view codespace(const error_code value) {
  switch (value) {
    case error_code::ok:
      return "";
    case error_code::illegal_transition:
      return "orca.policy";
    case error_code::insufficient_funds:
    case error_code::state_not_found:
    case error_code::ambiguous_state:
    case error_code::fee_estimation_failed:
      return "orca.resource";
    case error_code::schema_mismatch:
      return "orca.schema";
    case error_code::unexpected_signer:
    case error_code::stale_transaction:
    case error_code::session_not_found:
    case error_code::invalid_witness:
      return "orca.coordination";
    case error_code::network_error:
    case error_code::rejected:
      return "orca.submission";
  }
  return "orca.unknown";
}

/// True only for failures where resending the identical bytes may succeed.
inline constexpr bool retryable(const error_code value) {
  return value == error_code::network_error;
}

}  // namespace orca::schema
