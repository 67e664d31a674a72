#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "Chest.hh"
#include "Errors.hh"

using namespace NeutopiaRando;

TEST(ChestTests, ParsesFixedSizeTable) {
  std::string data("\xAA\x00\x0A\x20\x00\x08\x02\x21\x00\x12\x00\x22\x00\xBB", 14);
  auto chests = parse_chest_table(data, 1, 3);
  ASSERT_EQ(chests.size(), 3u);
  EXPECT_EQ(chests[0], (Chest{BOMBS, 10, 0x20, 0x00}));
  EXPECT_EQ(chests[1], (Chest{SWORD, 2, 0x21, 0x00}));
  EXPECT_EQ(chests[2], (Chest{MEDALLION_BASE, 0, 0x22, 0x00}));
  EXPECT_EQ(serialize_chest_table(chests), data.substr(1, 12));
}

TEST(ChestTests, RejectsShortTable) {
  std::string data(31, '\0');
  EXPECT_THROW(parse_chest_table(data, 0, 8), short_table);
  EXPECT_THROW(parse_chest_table(data, 40, 1), short_table);
  EXPECT_EQ(parse_chest_table(data + '\0', 0, 8).size(), 8u);
}

TEST(ChestTests, NamesItems) {
  EXPECT_EQ((Chest{BOMBS, 10, 0, 0}).name(), "Bombs x10");
  EXPECT_EQ((Chest{SWORD, 2, 0, 0}).name(), "Bronze Sword");
  EXPECT_EQ((Chest{ARMOR, 4, 0, 0}).name(), "Strongest Armor");
  EXPECT_EQ((Chest{FIRE_WAND, 0, 0, 0}).name(), "Fire Wand");
  EXPECT_EQ((Chest{CRYPT_KEY, 0, 0, 0}).name(), "Crypt Key");
  EXPECT_EQ((Chest{MEDALLION_BASE + 2, 0, 0, 0}).name(), "Crypt 3 Medallion");
  EXPECT_EQ((Chest{0x40, 0, 0, 0}).name(), "Unknown");
}

TEST(ChestTests, IdentifiesMedallions) {
  EXPECT_FALSE((Chest{CRYPT_KEY, 0, 0, 0}).is_medallion());
  EXPECT_TRUE((Chest{MEDALLION_BASE, 0, 0, 0}).is_medallion());
  EXPECT_TRUE((Chest{MEDALLION_BASE + 7, 0, 0, 0}).is_medallion());
  EXPECT_FALSE((Chest{MEDALLION_BASE + 8, 0, 0, 0}).is_medallion());
}

TEST(ChestTests, ComparesAndHashesByValue) {
  Chest a{BOMBS, 10, 0x20, 0x00};
  Chest b{BOMBS, 10, 0x20, 0x01};
  EXPECT_NE(a, b);
  EXPECT_LT(a, b);
  EXPECT_FALSE(b < a);

  std::unordered_set<Chest, ChestHash> chests;
  chests.emplace(a);
  chests.emplace(Chest{BOMBS, 10, 0x20, 0x00});
  chests.emplace(b);
  EXPECT_EQ(chests.size(), 2u);
}

TEST(ChestTests, NamesAreas) {
  EXPECT_STREQ(area_name(0x00), "Land Sphere");
  EXPECT_STREQ(area_name(0x04), "Crypt 1");
  EXPECT_STREQ(area_name(0x0B), "Crypt 8");
  EXPECT_STREQ(area_name(0x10), "Dirth's Lair");
  EXPECT_STREQ(area_name(0x11), "Unknown Area");
}
