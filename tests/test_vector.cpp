#include <gtest/gtest.h>
#include <limits>
#include <namedvec/stack_allocator.hpp>
#include <namedvec/vector.hpp>
#include <string>

struct HeavyType {
  std::string data;
  HeavyType(std::string s) : data(std::move(s)) {}
  HeavyType(const HeavyType &) = delete;
  HeavyType(HeavyType &&other) noexcept : data(std::move(other.data)) {}
  HeavyType &operator=(HeavyType &&other) noexcept {
    data = std::move(other.data);
    return *this;
  }
};

struct MockClonable {
  int value;
  bool fail_on_clone = false;

  [[nodiscard]] namedvec::result<MockClonable> try_clone() const noexcept {
    if (fail_on_clone) {
      return namedvec::unexpected(namedvec::error::allocation_failed);
    }
    return MockClonable{value, false};
  }
};

static_assert(!namedvec::is_relocatable<HeavyType>::value,
              "HeavyType should not be relocatable");

static_assert(namedvec::is_relocatable<namedvec::vector<HeavyType>>::value,
              "vector should be relocatable");

static_assert(namedvec::has_try_clone<MockClonable>,
              "Trait should detect try_clone method");

// try_push_back takes ownership; copying an lvalue in has to be spelled out.
template <typename V, typename Arg>
concept push_back_accepts =
    requires(V &v, Arg &&arg) { v.try_push_back(std::forward<Arg>(arg)); };

static_assert(push_back_accepts<namedvec::vector<int>, int>);
static_assert(!push_back_accepts<namedvec::vector<int>, int &>);
static_assert(!push_back_accepts<namedvec::vector<HeavyType>, HeavyType &>);

TEST(NamedvecVectorTest, EmplaceAndIterate) {
  auto vec = namedvec::vector<int>::try_create(2).value();

  ASSERT_TRUE(vec.try_emplace_back(10));
  ASSERT_TRUE(vec.try_emplace_back(20));

  int sum = 0;
  for (int x : vec)
    sum += x;
  EXPECT_EQ(sum, 30);

  int reversed = 0;
  for (auto it = vec.rbegin(); it != vec.rend(); ++it)
    reversed = reversed * 100 + *it;
  EXPECT_EQ(reversed, 2010);
}

TEST(NamedvecVectorTest, FalliblePop) {
  auto vec = namedvec::vector<int>::try_create().value();
  auto res = vec.try_pop_back();
  EXPECT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), namedvec::error::container_empty);

  ASSERT_TRUE(vec.try_push_back(1));
  ASSERT_TRUE(vec.try_pop_back());
  EXPECT_TRUE(vec.empty());
}

TEST(NamedvecVectorTest, EmplaceBackReturnsPointer) {
  auto vec = namedvec::vector<std::string>::try_create(1).value();

  auto res = vec.try_emplace_back("hello hardware");
  ASSERT_TRUE(res.has_value());

  // Check that we can modify the element via the returned pointer
  auto ptr = *res;
  EXPECT_EQ(*ptr, "hello hardware");

  ptr->append(" honest");
  EXPECT_EQ(vec[0], "hello hardware honest");
  EXPECT_EQ(vec.back(), "hello hardware honest");
}

TEST(NamedvecVectorTest, TryAtChecksBounds) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_push_back(5));

  auto ok = vec.try_at(0);
  ASSERT_TRUE(ok.has_value());
  **ok = 6;
  EXPECT_EQ(vec[0], 6);

  const auto &cvec = vec;
  auto miss = cvec.try_at(1);
  ASSERT_FALSE(miss.has_value());
  EXPECT_EQ(miss.error(), namedvec::error::out_of_range);
}

TEST(NamedvecVectorTest, SubscriptDiesOutOfBounds) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_push_back(1));

  EXPECT_DEATH(vec[1], "index out of bounds");
  vec.clear();
  EXPECT_DEATH(vec.back(), "empty vector");
}

TEST(NamedvecVectorComplexTest, NonRelocatableTypeGrowth) {
  namedvec::vector<HeavyType> v;
  for (int i = 0; i < 20; ++i)
    ASSERT_TRUE(v.try_emplace_back(std::to_string(i)));

  ASSERT_EQ(v.size(), 20);
  EXPECT_EQ(v[0].data, "0");
  EXPECT_EQ(v[19].data, "19");
}

TEST(NamedvecVectorTest, GrowthIsGeometric) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_push_back(1));
  EXPECT_EQ(vec.capacity(), 8);

  for (int i = 0; i < 8; ++i)
    ASSERT_TRUE(vec.try_emplace_back(i));
  EXPECT_EQ(vec.capacity(), 16);

  ASSERT_TRUE(vec.try_grow(100));
  EXPECT_GE(vec.capacity(), 109);
}

TEST(NamedvecVectorTest, GrowReportsOverflow) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_push_back(1));

  auto res = vec.try_grow(namedvec::vector<int>::max_size());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), namedvec::error::integer_overflow);
  EXPECT_EQ(vec.size(), 1);
}

TEST(NamedvecVectorTest, ReserveOverflow) {
  namedvec::vector<int> vec;
  auto res = vec.try_reserve(std::numeric_limits<std::size_t>::max());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), namedvec::error::integer_overflow);
}

TEST(NamedvecVectorTest, TruncateAndShrink) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_reserve(32));
  for (int i = 0; i < 5; ++i)
    ASSERT_TRUE(vec.try_push_back(int(i)));

  vec.truncate(10);
  EXPECT_EQ(vec.size(), 5);

  vec.truncate(3);
  EXPECT_EQ(vec.size(), 3);
  EXPECT_EQ(vec[2], 2);

  ASSERT_TRUE(vec.try_shrink_to_fit());
  EXPECT_EQ(vec.capacity(), 3);
  EXPECT_EQ(vec[0], 0);

  vec.clear();
  ASSERT_TRUE(vec.try_shrink_to_fit());
  EXPECT_EQ(vec.capacity(), 0);
}

TEST(NamedvecVectorTest, AsSpanViewsElements) {
  namedvec::vector<int> vec;
  ASSERT_TRUE(vec.try_push_back(4));
  ASSERT_TRUE(vec.try_push_back(5));

  auto s = vec.as_span();
  ASSERT_EQ(s.size(), 2);
  EXPECT_EQ(s[1], 5);
  EXPECT_EQ(s.data(), &vec[0]);
}

TEST(NamedvecVectorTest, SuccessStandardTypeForClone) {
  namedvec::vector<std::string> original;
  ASSERT_TRUE(original.try_push_back("hello"));
  ASSERT_TRUE(original.try_push_back("world"));

  auto clone_res = original.try_clone();
  ASSERT_TRUE(clone_res) << "Clone failed for standard types";

  auto &clone = *clone_res;
  EXPECT_EQ(clone.size(), 2);
  EXPECT_EQ(clone[0], "hello");
  EXPECT_EQ(clone[1], "world");

  // Verify it's a deep copy of the container (different addresses)
  EXPECT_NE(&original[0], &clone[0]);
}

TEST(NamedvecVectorTest, SuccessRecursiveClone) {
  namedvec::vector<MockClonable> original;
  ASSERT_TRUE(original.try_push_back({42, false}));
  ASSERT_TRUE(original.try_push_back({100, false}));

  auto clone_res = original.try_clone();
  ASSERT_TRUE(clone_res);
  EXPECT_EQ((*clone_res)[0].value, 42);
  EXPECT_EQ((*clone_res)[1].value, 100);
}

TEST(NamedvecVectorTest, FailsWhenElementCloneFails) {
  namedvec::vector<MockClonable> original;
  ASSERT_TRUE(original.try_push_back({1, false}));
  ASSERT_TRUE(
      original.try_push_back({2, true})); // This one will trigger an error

  auto clone_res = original.try_clone();

  // The entire vector clone should fail because the second element failed
  EXPECT_FALSE(clone_res);
  EXPECT_EQ(clone_res.error(), namedvec::error::allocation_failed);
}

TEST(NamedvecVectorTest, CloneEmptyVector) {
  namedvec::vector<int> original;
  auto clone_res = original.try_clone();

  ASSERT_TRUE(clone_res);
  EXPECT_EQ(clone_res->size(), 0);
  EXPECT_EQ(clone_res->capacity(), 0);
}

TEST(NamedvecVectorEmplace, HandlesTryCreate) {
  struct FallibleWidget {
    int id;
    static namedvec::result<FallibleWidget> try_create(int id) noexcept {
      if (id < 0)
        return namedvec::unexpected(namedvec::error::invalid_argument);
      return FallibleWidget{id};
    }
  };

  namedvec::vector<FallibleWidget> v;

  // Test Success
  auto res_ok = v.try_emplace_back(42);
  ASSERT_TRUE(res_ok);
  EXPECT_EQ(v.size(), 1);
  EXPECT_EQ(v[0].id, 42);

  // Test Failure propagation
  auto res_fail = v.try_emplace_back(-1);
  EXPECT_FALSE(res_fail);
  EXPECT_EQ(res_fail.error(), namedvec::error::invalid_argument);
  EXPECT_EQ(v.size(), 1); // Size should not have incremented
}

TEST(NamedvecVectorArena, GrowsInPlaceOnTopOfArena) {
  constexpr std::size_t kBufferSize = 1024;
  alignas(std::max_align_t) std::byte buffer[kBufferSize]{};
  namedvec::stack_allocator arena(buffer, kBufferSize);

  auto vec = namedvec::vector<int, namedvec::stack_allocator>::try_allocate(
                 arena, 4)
                 .value();
  const int *first = vec.begin();

  // The block is the arena's last one, so it can be bumped without moving.
  ASSERT_TRUE(vec.try_reserve(64));
  EXPECT_EQ(vec.begin(), first);
  EXPECT_EQ(arena.allocations(), 1);

  auto too_big = vec.try_reserve(4096);
  ASSERT_FALSE(too_big.has_value());
  EXPECT_EQ(too_big.error(), namedvec::error::allocation_failed);
  EXPECT_EQ(vec.capacity(), 64);
}
