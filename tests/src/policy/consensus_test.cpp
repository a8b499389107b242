#include <gtest/gtest.h>
#include <orca/policy/consensus.hpp>

#include <limits>
#include <vector>

TEST(consensus, median_of_odd_and_even_counts) {
  auto odd = std::vector<int64_t>{3, 1, 2};
  EXPECT_EQ(orca::policy::median(odd), 2);

  auto even = std::vector<int64_t>{4, 1, 3, 2};
  EXPECT_EQ(orca::policy::median(even), 2);

  auto negative = std::vector<int64_t>{-3, -2};
  EXPECT_EQ(orca::policy::median(negative), -2);
}

TEST(consensus, median_does_not_overflow) {
  auto large = std::vector<int64_t>{std::numeric_limits<int64_t>::max(),
                                    std::numeric_limits<int64_t>::max() - 2};
  EXPECT_EQ(orca::policy::median(large),
            std::numeric_limits<int64_t>::max() - 1);
}

TEST(consensus, divergence_filter_drops_far_feeds) {
  // 500 survives the IQR bounds here; only divergence removes it.
  auto feeds = std::vector<int64_t>{102, 500, 100, 103, 101};
  auto agreed = orca::policy::consensus(feeds, 2, 1000);
  EXPECT_EQ(agreed.median, 102);
  EXPECT_EQ(agreed.on_consensus, (std::vector<int64_t>{100, 101, 102, 103}));
}

TEST(consensus, iqr_filter_drops_outliers) {
  auto feeds = std::vector<int64_t>{100, 100, 100, 100, 100, 104};
  auto agreed = orca::policy::consensus(feeds, 2, 10'000);
  EXPECT_EQ(agreed.median, 100);
  EXPECT_EQ(agreed.on_consensus,
            (std::vector<int64_t>{100, 100, 100, 100, 100}));
}

TEST(consensus, wider_multiplier_keeps_more_feeds) {
  // q1 = 101, q3 = 105, iqr = 4.
  auto feeds = std::vector<int64_t>{100, 101, 102, 103, 104, 105, 140};
  auto narrow = orca::policy::consensus(feeds, 1, 10'000);
  auto wide = orca::policy::consensus(feeds, 10, 10'000);
  EXPECT_EQ(narrow.on_consensus,
            (std::vector<int64_t>{100, 101, 102, 103, 104, 105}));
  EXPECT_EQ(wide.on_consensus.size(), feeds.size());
}

TEST(consensus, multiplier_is_a_whole_number_of_iqrs) {
  // q1 = 100, q3 = 200, iqr = 100: k = 2 gives [-100, 400].
  auto skewed = std::vector<int64_t>{100, 100, 100, 100, 300};
  auto agreed = orca::policy::consensus(skewed, 2, 30'000);
  EXPECT_EQ(agreed.median, 100);
  EXPECT_EQ(agreed.on_consensus, skewed);

  // q1 = 25, q3 = 65, iqr = 40: k = 1 gives [-15, 105], k = 24 reaches 1025.
  auto feeds = std::vector<int64_t>{10, 20, 30, 40, 50, 60, 70, 1000};
  auto one = orca::policy::consensus(feeds, 1, 1'000'000);
  EXPECT_EQ(one.median, 45);
  EXPECT_EQ(one.on_consensus,
            (std::vector<int64_t>{10, 20, 30, 40, 50, 60, 70}));
  auto twenty_four = orca::policy::consensus(feeds, 24, 1'000'000);
  EXPECT_EQ(twenty_four.on_consensus, feeds);
  auto twenty_three = orca::policy::consensus(feeds, 23, 1'000'000);
  EXPECT_EQ(twenty_three.on_consensus.size(), 7u);
}

TEST(consensus, single_feed_agrees_with_itself) {
  auto feeds = std::vector<int64_t>{42};
  auto agreed = orca::policy::consensus(feeds, 2, 1);
  EXPECT_EQ(agreed.median, 42);
  EXPECT_EQ(agreed.on_consensus, (std::vector<int64_t>{42}));
}

TEST(consensus, within_divergence_is_inclusive) {
  EXPECT_TRUE(orca::policy::within_divergence(110, 100, 1000));
  EXPECT_TRUE(orca::policy::within_divergence(90, 100, 1000));
  EXPECT_FALSE(orca::policy::within_divergence(111, 100, 1000));
  EXPECT_TRUE(orca::policy::within_divergence(0, 0, 1));
}

TEST(consensus, change_in_basis_points) {
  EXPECT_EQ(orca::policy::change_basis_points(100, 101), 100u);
  EXPECT_EQ(orca::policy::change_basis_points(100, 99), 100u);
  EXPECT_EQ(orca::policy::change_basis_points(10'000, 10'000), 0u);
  EXPECT_EQ(orca::policy::change_basis_points(0, 0), 0u);
  EXPECT_EQ(orca::policy::change_basis_points(0, 5),
            std::numeric_limits<uint64_t>::max());
}
