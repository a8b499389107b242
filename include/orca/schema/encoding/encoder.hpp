#pragma once
#include <orca/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>

namespace orca::schema::encoding {

// Two backends specialize this template: CBOR for everything that lands on
// chain (datums, redeemers, transactions) and SCALE for records that only
// this engine reads back (signing sessions, transport envelopes). The choice
// is made at the call site through the tag type; there is no runtime
// registry.
template <typename Library>
struct encoder {
  template <typename T>
  orca::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, orca::schema::bytes_t& out);

  template <typename T>
  T decode(const orca::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const orca::schema::bytes_view_t& bytes);

  /// As try_decode, reporting the failure reason through `error`.
  template <typename T>
  std::optional<T> try_decode(const orca::schema::bytes_view_t& bytes,
                              std::string& error);
};

}  // namespace orca::schema::encoding
