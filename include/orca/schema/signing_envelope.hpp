#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/transaction.hpp>

#include <vector>

// Schema type: signing envelope.
// Transport unit exchanged between signers out of band: the transaction
// bytes plus whatever witnesses the sender holds so far.
namespace orca::schema {

template <uint16_t Version>
struct signing_envelope;

template <>
struct signing_envelope<1> final {
  uint16_t version{1};
  bytes_t transaction;
  std::vector<key_hash_t> required_signers;
  std::vector<vkey_witness_t> witnesses;

  bool operator==(const signing_envelope&) const = default;
};

using signing_envelope_t = signing_envelope<1>;

}  // namespace orca::schema
