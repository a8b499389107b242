#pragma once

#include <orca/schema/primitives.hpp>

#include <string_view>

// Schema key type: signing session.
// Sessions live under one prefix, suffixed by the raw 32-byte transaction id.
namespace orca::schema::key {

inline constexpr std::string_view kSessionKeyPrefix{"ORCA|SESSION|"};

bytes_t make_session_key(const tx_id_t& session_id);

}  // namespace orca::schema::key
