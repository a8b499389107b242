#pragma once

#include <orca/schema/primitives.hpp>

#include <optional>

// Schema type: node entry.
// One registered operator: its credential, latest feed and unclaimed reward.
namespace orca::schema {

struct data_feed_t final {
  int64_t value{};
  timestamp_milliseconds_t last_update{};

  bool operator==(const data_feed_t&) const = default;
};

template <uint16_t Version>
struct node_entry;

template <>
struct node_entry<1> final {
  uint16_t version{1};
  key_hash_t operator_key{};
  std::optional<data_feed_t> feed;
  quantity_t reward{};

  bool operator==(const node_entry&) const = default;
};

using node_entry_t = node_entry<1>;

}  // namespace orca::schema
