#pragma once

#include <cstdint>
#include <span>
#include <vector>

// Consensus over fresh node feeds. Quartiles are taken as medians of the
// lower and upper halves of the sorted feeds, excluding the middle element
// for odd counts. Every intermediate product is computed in 128 bits.
namespace orca::policy {

struct consensus_result_t final {
  int64_t median{};
  // Feeds that pass both the IQR and the divergence filter, sorted.
  std::vector<int64_t> on_consensus;

  bool operator==(const consensus_result_t&) const = default;
};

/// Middle of the sorted values; the mean of the two middle values, truncated
/// toward zero, for even counts. `values` must not be empty.
int64_t median(std::span<const int64_t> values);

/// True when `x` lies within `divergence` basis points of `median`.
bool within_divergence(int64_t x, int64_t median, uint32_t divergence);

/// Feeds outside `[q1 - k*iqr, q3 + k*iqr]` with `k = iqr_multiplier` are
/// dropped. `divergence` is in basis points of the median. `feeds` must not
/// be empty.
consensus_result_t consensus(std::span<const int64_t> feeds,
                             uint32_t iqr_multiplier,
                             uint32_t divergence);

/// Absolute change between two prices in basis points of `previous`.
uint64_t change_basis_points(int64_t previous, int64_t next);

}  // namespace orca::policy
