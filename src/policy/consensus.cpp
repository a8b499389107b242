#include <orca/common/critical.hpp>
#include <orca/policy/consensus.hpp>
#include <orca/schema/oracle_settings.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

namespace orca::policy {

namespace {

using wide_t = boost::multiprecision::int128_t;

wide_t abs_wide(const wide_t& value) {
  return value < 0 ? wide_t{-value} : value;
}

// Twice the median of a sorted, non-empty range; keeps halves exact.
wide_t doubled_median(std::span<const int64_t> sorted) {
  auto size = sorted.size();
  if (size % 2 == 1) {
    return wide_t{sorted[size / 2]} * 2;
  }
  return wide_t{sorted[(size / 2) - 1]} + wide_t{sorted[size / 2]};
}

std::vector<int64_t> sorted_copy(std::span<const int64_t> values) {
  auto sorted = std::vector<int64_t>{std::begin(values), std::end(values)};
  std::sort(std::begin(sorted), std::end(sorted));
  return sorted;
}

}  // namespace

int64_t median(std::span<const int64_t> values) {
  if (values.empty()) {
    orca::common::critical("median of an empty feed set");
  }
  auto sorted = sorted_copy(values);
  return static_cast<int64_t>(doubled_median(sorted) / 2);
}

bool within_divergence(const int64_t x,
                       const int64_t median,
                       const uint32_t divergence) {
  auto distance = abs_wide(wide_t{x} - wide_t{median});
  if (median == 0) {
    return distance == 0;
  }
  auto scaled = (distance * orca::schema::kFactorResolution) /
                abs_wide(wide_t{median});
  return scaled <= divergence;
}

consensus_result_t consensus(std::span<const int64_t> feeds,
                             const uint32_t iqr_multiplier,
                             const uint32_t divergence) {
  if (feeds.empty()) {
    orca::common::critical("consensus over an empty feed set");
  }
  auto sorted = sorted_copy(feeds);
  auto out = consensus_result_t{};
  out.median = static_cast<int64_t>(doubled_median(sorted) / 2);

  auto size = sorted.size();
  auto lower_half = std::span<const int64_t>{sorted.data(), size / 2};
  auto upper_half = std::span<const int64_t>{
      sorted.data() + (size / 2) + (size % 2), size / 2};
  if (size == 1) {
    lower_half = std::span<const int64_t>{sorted.data(), 1};
    upper_half = lower_half;
  }

  // Bounds are compared at 2x scale since the quartiles are doubled.
  auto q1 = doubled_median(lower_half);
  auto q3 = doubled_median(upper_half);
  auto iqr = q3 - q1;
  auto lower = q1 - (iqr * iqr_multiplier);
  auto upper = q3 + (iqr * iqr_multiplier);

  for (const auto x : sorted) {
    auto scaled = wide_t{x} * 2;
    if (scaled < lower || scaled > upper) {
      continue;
    }
    if (!within_divergence(x, out.median, divergence)) {
      continue;
    }
    out.on_consensus.push_back(x);
  }
  return out;
}

uint64_t change_basis_points(const int64_t previous, const int64_t next) {
  auto distance = abs_wide(wide_t{next} - wide_t{previous});
  if (previous == 0) {
    return distance == 0 ? 0 : std::numeric_limits<uint64_t>::max();
  }
  auto scaled = (distance * orca::schema::kFactorResolution) /
                abs_wide(wide_t{previous});
  if (scaled > std::numeric_limits<uint64_t>::max()) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(scaled);
}

}  // namespace orca::policy
