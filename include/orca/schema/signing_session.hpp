#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/transaction.hpp>
#include <orca/schema/transaction_status.hpp>

#include <variant>
#include <vector>

// Schema type: signing session.
// Persisted record of one multisig round, keyed by the transaction id.
namespace orca::schema {

template <uint16_t Version>
struct signing_session;

template <>
struct signing_session<1> final {
  uint16_t version{1};
  tx_id_t session_id{};
  bytes_t transaction;  // unsigned transaction CBOR
  std::vector<key_hash_t> required_signers;
  std::vector<vkey_witness_t> witnesses;

  bool operator==(const signing_session&) const = default;
};

using signing_session_t = signing_session<1>;

struct session_pending_t final {
  std::vector<key_hash_t> missing;
  std::size_t collected{};
  std::size_t required{};

  bool operator==(const session_pending_t&) const = default;
};

struct session_complete_t final {
  tx_id_t tx_id{};
  bytes_t signed_transaction;

  bool operator==(const session_complete_t&) const = default;
};

using session_status_t = std::variant<session_pending_t, session_complete_t>;

inline transaction_status_t to_transaction_status(
    const session_status_t& status) {
  if (std::holds_alternative<session_complete_t>(status)) {
    return transaction_status_t::fully_signed;
  }
  const auto& pending = std::get<session_pending_t>(status);
  return pending.collected == 0 ? transaction_status_t::unsigned_transaction
                                : transaction_status_t::partially_signed;
}

}  // namespace orca::schema
