#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "Errors.hh"
#include "Random.hh"

using namespace NeutopiaRando;

TEST(RandomTests, SameSeedGivesSameSequence) {
  Pcg32Generator a(0x1234567890ABCDEF);
  Pcg32Generator b(0x1234567890ABCDEF);
  for (size_t z = 0; z < 100; z++) {
    EXPECT_EQ(a.next(), b.next());
  }
  EXPECT_EQ(a.seed(), 0x1234567890ABCDEFu);
}

TEST(RandomTests, DifferentSeedsGiveDifferentSequences) {
  Pcg32Generator a(1);
  Pcg32Generator b(2);
  size_t matches = 0;
  for (size_t z = 0; z < 16; z++) {
    matches += (a.next() == b.next());
  }
  EXPECT_LT(matches, 16u);
}

TEST(RandomTests, IndexesStayInRange) {
  Pcg32Generator rand(7);
  for (size_t z = 0; z < 1000; z++) {
    EXPECT_LT(rand.next_index(13), 13u);
  }
  EXPECT_EQ(rand.next_index(1), 0u);
  EXPECT_THROW(rand.next_index(0), std::logic_error);
}

TEST(RandomTests, ShuffleIsAPermutation) {
  std::vector<int> items;
  for (int z = 0; z < 50; z++) {
    items.emplace_back(z);
  }
  auto shuffled = items;
  Pcg32Generator rand(99);
  shuffle(shuffled, rand);
  EXPECT_NE(shuffled, items);
  std::sort(shuffled.begin(), shuffled.end());
  EXPECT_EQ(shuffled, items);

  // Same seed, same order
  auto first = items;
  auto second = items;
  Pcg32Generator rand1(5);
  Pcg32Generator rand2(5);
  shuffle(first, rand1);
  shuffle(second, rand2);
  EXPECT_EQ(first, second);

  std::vector<int> empty;
  shuffle(empty, rand);
  EXPECT_TRUE(empty.empty());
}

TEST(RandomTests, ChoosesFromVector) {
  std::vector<std::string> items = {"a", "b", "c"};
  Pcg32Generator rand(3);
  for (size_t z = 0; z < 20; z++) {
    const auto& item = choose(items, rand);
    EXPECT_NE(std::find(items.begin(), items.end(), item), items.end());
  }
  std::vector<std::string> empty;
  EXPECT_THROW(choose(empty, rand), std::logic_error);
}

TEST(RandomTests, ParsesBase36Seeds) {
  EXPECT_EQ(parse_base36_seed("0"), 0u);
  EXPECT_EQ(parse_base36_seed("z"), 35u);
  EXPECT_EQ(parse_base36_seed("10"), 36u);
  EXPECT_EQ(parse_base36_seed("ZZ"), 36u * 36u - 1);
  EXPECT_EQ(parse_base36_seed("Neutopia"), parse_base36_seed("neutopia"));
  // Largest 64-bit value
  EXPECT_EQ(parse_base36_seed("3w5e11264sgsf"), 0xFFFFFFFFFFFFFFFFu);
}

TEST(RandomTests, RejectsBadSeeds) {
  EXPECT_THROW(parse_base36_seed(""), invalid_seed);
  EXPECT_THROW(parse_base36_seed("abc-def"), invalid_seed);
  EXPECT_THROW(parse_base36_seed(" abc"), invalid_seed);
  EXPECT_THROW(parse_base36_seed("3w5e11264sgsg"), invalid_seed);
  EXPECT_THROW(parse_base36_seed("zzzzzzzzzzzzzzzzzzzz"), invalid_seed);
}

TEST(RandomTests, FormatsBase36Seeds) {
  EXPECT_EQ(format_base36_seed(0), "0");
  EXPECT_EQ(format_base36_seed(35), "Z");
  EXPECT_EQ(format_base36_seed(36), "10");
  EXPECT_EQ(format_base36_seed(0xFFFFFFFFFFFFFFFF), "3W5E11264SGSF");
  for (uint64_t seed : {1ULL, 1000ULL, 0xDEADBEEFULL, 0x0123456789ABCDEFULL}) {
    EXPECT_EQ(parse_base36_seed(format_base36_seed(seed)), seed);
  }
}
