#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>

namespace orca::submission {

/// Write side of the node. `submit` answers rejected when the ledger refused
/// the transaction and network_error when the outcome is unknown.
class submission_service {
 public:
  virtual ~submission_service() = default;

  virtual orca::schema::result<orca::schema::tx_id_t> submit(
      const orca::schema::bytes_view_t& signed_transaction) = 0;

  virtual orca::schema::result<bool> is_confirmed(
      const orca::schema::tx_id_t& tx_id) = 0;
};

}  // namespace orca::submission
