#include <algorithm>
#include <gtest/gtest.h>
#include <namedvec/span.hpp>

class HardenedSpanTest : public ::testing::Test {
protected:
  int raw_data[5] = {10, 20, 30, 40, 50};
};

TEST_F(HardenedSpanTest, STLInteroperability) {
  int data[] = {3, 1, 2};
  namedvec::span<int> s(data, 3);

  int sum = 0;
  for (int val : s)
    sum += val;
  EXPECT_EQ(sum, 6);

  std::sort(s.begin(), s.end());
  EXPECT_EQ(s[0], 1);
  EXPECT_EQ(s[2], 3);

  std::span<int> std_view = s.to_std();
  EXPECT_EQ(std_view.size(), 3);
}

TEST_F(HardenedSpanTest, TryAtReturnsValidReference) {
  namedvec::span<int> s(raw_data, 5);

  auto res = s.try_at(2);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->get(), 30);

  res->get() = 99;
  EXPECT_EQ(raw_data[2], 99);

  auto out_of_bounds = s.try_at(10);
  EXPECT_FALSE(out_of_bounds.has_value());
  EXPECT_EQ(out_of_bounds.error(), namedvec::error::out_of_bounds);
}

TEST_F(HardenedSpanTest, OperatorSquareBracketsAsserts) {
  namedvec::span<int> s(raw_data, 5);

  EXPECT_EQ(s[0], 10);

  EXPECT_DEATH(s[10], "");
}

TEST_F(HardenedSpanTest, UnsafeAt) {
  namedvec::span<int> s(raw_data, 5);

  EXPECT_EQ(s.unsafe_at(4), 50);
}

TEST_F(HardenedSpanTest, TrySubspanLogic) {
  namedvec::span<int> s(raw_data, 5);

  auto sub = s.try_subspan(1, 3); // {20, 30, 40}
  ASSERT_TRUE(sub.has_value());
  EXPECT_EQ(sub->size(), 3);
  EXPECT_EQ(sub->unsafe_at(0), 20);

  // Empty tail is valid
  auto tail = s.try_subspan(5, 0);
  ASSERT_TRUE(tail.has_value());
  EXPECT_TRUE(tail->empty());

  EXPECT_FALSE(s.try_subspan(6, 1).has_value());
  EXPECT_FALSE(s.try_subspan(2, 4).has_value());
}

TEST_F(HardenedSpanTest, FrontBackAndReverse) {
  namedvec::span<int> s(raw_data, 5);

  EXPECT_EQ(s.front(), 10);
  EXPECT_EQ(s.back(), 50);
  EXPECT_EQ(*s.rbegin(), 50);
  EXPECT_EQ(std::distance(s.rbegin(), s.rend()), 5);
}

TEST_F(HardenedSpanTest, ConstSpanPreventsModification) {
  const int const_data[3] = {1, 2, 3};
  namedvec::span<const int> s(const_data, 3);

  auto res = s.try_at(0);
  EXPECT_EQ(res->get(), 1);
}

TEST_F(HardenedSpanTest, EmptySpanSafety) {
  namedvec::span<int> empty_s(nullptr, 0);

  EXPECT_TRUE(empty_s.empty());
  EXPECT_EQ(empty_s.size(), 0);
  EXPECT_FALSE(empty_s.try_at(0).has_value());

  EXPECT_DEATH(empty_s.front(), "empty span");
  EXPECT_DEATH(empty_s.back(), "empty span");
}
