#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/protocol_parameters.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/slot_config.hpp>
#include <orca/schema/utxo.hpp>

#include <vector>

namespace orca::chain {

/// Read side of the indexer. Implementations report transport failures as
/// network_error; they never throw across this interface.
class chain_backend {
 public:
  virtual ~chain_backend() = default;

  /// Every unspent output currently locked at `address`.
  virtual orca::schema::result<std::vector<orca::schema::utxo_t>> utxos_at(
      const orca::schema::bytes_view_t& address) = 0;

  /// The subset of `references` that is still unspent.
  virtual orca::schema::result<std::vector<orca::schema::utxo_t>>
  utxos_by_reference(
      const std::vector<orca::schema::output_reference_t>& references) = 0;

  virtual orca::schema::result<orca::schema::slot_t> tip() = 0;

  virtual orca::schema::result<orca::schema::protocol_parameters_t>
  protocol_parameters() = 0;

  virtual orca::schema::slot_config_t slot_config() const = 0;
};

}  // namespace orca::chain
