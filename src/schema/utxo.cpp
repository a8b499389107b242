#include <orca/schema/utxo.hpp>

#include <spdlog/fmt/fmt.h>

namespace orca::schema {

std::string to_string(const output_reference_t& reference) {
  return fmt::format("{}#{}", to_hex(reference.tx_id), reference.index);
}

}  // namespace orca::schema
