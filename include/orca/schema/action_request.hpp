#pragma once

#include <orca/schema/add_funds.hpp>
#include <orca/schema/add_nodes.hpp>
#include <orca/schema/aggregate.hpp>
#include <orca/schema/close_oracle.hpp>
#include <orca/schema/create_reference_script.hpp>
#include <orca/schema/edit_settings.hpp>
#include <orca/schema/enum_string.hpp>
#include <orca/schema/node_collect.hpp>
#include <orca/schema/node_update.hpp>
#include <orca/schema/platform_collect.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/remove_nodes.hpp>

#include <array>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: action request.
// A validated intent against the oracle. The payload alternative index is the
// redeemer constructor index, so the order below is part of the on-chain
// schema.
namespace orca::schema {

using action_payload_t = std::variant<node_update_t,
                                      node_collect_t,
                                      platform_collect_t,
                                      aggregate_t,
                                      edit_settings_t,
                                      add_nodes_t,
                                      remove_nodes_t,
                                      close_oracle_t,
                                      add_funds_t,
                                      create_reference_script_t>;

template <uint16_t Version>
struct action_request;

template <>
struct action_request<1> final {
  uint16_t version{1};
  key_hash_t caller{};
  // Platform co-signers chosen for owner actions; ignored otherwise.
  std::vector<key_hash_t> platform_signers;
  action_payload_t payload;

  bool operator==(const action_request&) const = default;
};

using action_request_t = action_request<1>;

inline constexpr auto kActionNames = std::array<std::string_view, 10>{
    "node_update", "node_collect",     "platform_collect",
    "aggregate",   "edit_settings",    "add_nodes",
    "remove_nodes", "close",           "add_funds",
    "create_reference_script"};

static_assert(kActionNames.size() == std::variant_size_v<action_payload_t>);

inline std::string_view action_name(const action_payload_t& payload) {
  return kActionNames[payload.index()];
}

}  // namespace orca::schema
