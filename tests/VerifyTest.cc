#include <gtest/gtest.h>

#include <string>

#include "Errors.hh"
#include "RomMap.hh"
#include "Verify.hh"

using namespace NeutopiaRando;

TEST(VerifyTests, ReportsUnknownImage) {
  auto info = verify(std::string(ROM_SIZE, '\0'));
  EXPECT_FALSE(info.headered);
  EXPECT_FALSE(info.known);
  EXPECT_EQ(info.region, Region::UNKNOWN);
  EXPECT_EQ(info.description, "Unrecognized ROM");
  EXPECT_EQ(info.md5_hash.size(), 32u);
}

TEST(VerifyTests, HashesImageWithoutHeader) {
  std::string unheadered(ROM_SIZE, '\x5A');
  std::string headered = std::string(ROM_HEADER_SIZE, '\xFF') + unheadered;

  auto unheadered_info = verify(unheadered);
  auto headered_info = verify(headered);
  EXPECT_FALSE(unheadered_info.headered);
  EXPECT_TRUE(headered_info.headered);
  EXPECT_EQ(unheadered_info.md5_hash, headered_info.md5_hash);
}

TEST(VerifyTests, RejectsWrongSizes) {
  EXPECT_THROW(verify(""), invalid_rom_size);
  EXPECT_THROW(verify(std::string(ROM_SIZE - 1, '\0')), invalid_rom_size);
  EXPECT_THROW(verify(std::string(ROM_SIZE + 1, '\0')), invalid_rom_size);
  EXPECT_THROW(verify(std::string(ROM_SIZE * 2, '\0')), invalid_rom_size);
}

TEST(VerifyTests, RequiresKnownImage) {
  EXPECT_THROW(verify_rom(std::string(ROM_SIZE, '\0')), unrecognized_rom);
  EXPECT_THROW(verify_rom(std::string(ROM_SIZE + ROM_HEADER_SIZE, '\0')), unrecognized_rom);
  // Policy errors are invalid_argument, so the CLI can report them as usage
  // problems
  EXPECT_THROW(verify_rom(std::string(ROM_SIZE, '\0')), std::invalid_argument);
}

TEST(VerifyTests, NamesRegions) {
  EXPECT_STREQ(name_for_region(Region::NA), "NA");
  EXPECT_STREQ(name_for_region(Region::JP), "JP");
  EXPECT_STREQ(name_for_region(Region::UNKNOWN), "Unknown");
}
