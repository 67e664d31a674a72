#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Errors.hh"
#include "Neutopia.hh"
#include "NeutopiaRom.hh"
#include "Pointers.hh"
#include "TestRom.hh"

using namespace NeutopiaRando;
using Type = TableEntry::Type;

namespace {

Neutopia load_test_game(const RelocationOptions& relocation = TestRom::test_relocation()) {
  return Neutopia(TestRom::test_rom(), TestRom::test_rom_map(), relocation);
}

NeutopiaRom parse_output(const std::string& data) {
  return NeutopiaRom(data, TestRom::test_rom_map());
}

} // namespace

TEST(NeutopiaTests, ExtractsConditionals) {
  auto game = load_test_game();

  const auto& conditionals = game.get_conditionals();
  ASSERT_EQ(conditionals.size(), 1u);
  const auto& cond = conditionals.at(TestRom::BOMBS_5);
  EXPECT_EQ(cond.entries, TestRom::test_conditional_entries());

  const auto& object_table = game.get_areas()[4].rooms[0].object_table;
  ASSERT_EQ(object_table.size(), 2u);
  EXPECT_EQ(object_table[0], TestRom::chest_object(2, 3, 1));
  EXPECT_EQ(object_table[1], TableEntry::make(Type::BOSS_DOOR, 2));
}

TEST(NeutopiaTests, LeavesConditionalsOutsideRelocationRange) {
  RelocationOptions relocation;
  relocation.first_area = 0;
  relocation.last_area = 3;
  auto game = load_test_game(relocation);
  EXPECT_TRUE(game.get_conditionals().empty());
  EXPECT_EQ(game.get_areas()[4].rooms[0].object_table.size(), 4u);
}

TEST(NeutopiaTests, FiltersChests) {
  auto game = load_test_game();
  auto all = game.filter_chests([](const ChestRef&) -> bool { return true; });
  // Area 5's chest object has no chest table, so it isn't listed
  ASSERT_EQ(all.size(), 15u);
  EXPECT_EQ(all[0].info, TestRom::BOMBS_10);
  EXPECT_EQ(all[0].area, 0);
  EXPECT_EQ(all[0].room, 0);
  EXPECT_EQ(all[0].index, 0);

  auto area1 = game.filter_chests([](const ChestRef& ref) -> bool {
    return (ref.area == 1) && (ref.room == 1);
  });
  ASSERT_EQ(area1.size(), 2u);
  EXPECT_EQ(area1[0].info, TestRom::MEDICINE_CHEST);
  EXPECT_EQ(area1[0].index, 0);
  EXPECT_EQ(area1[1].info, TestRom::CRYSTAL_BALL_CHEST);
  EXPECT_EQ(area1[1].index, 1);

  auto medallions = game.filter_chests([](const ChestRef& ref) -> bool {
    return ref.info.is_medallion();
  });
  ASSERT_EQ(medallions.size(), 1u);
  EXPECT_EQ(medallions[0].area, 4);
  EXPECT_EQ(medallions[0].room, 1);
  EXPECT_EQ(medallions[0].str(), "Crypt 1 Medallion at 04:01:0");
}

TEST(NeutopiaTests, UpdatesChests) {
  auto game = load_test_game();
  game.update_chests({ChestRef{TestRom::BOMBS_10, 4, 2, 1}});
  EXPECT_EQ(game.get_areas()[4].chest_table[3], TestRom::BOMBS_10);
  // Other slots are untouched
  EXPECT_EQ(game.get_areas()[4].chest_table[2], TestRom::WINGS_CHEST);
}

TEST(NeutopiaTests, RejectsIncoherentChestRefs) {
  auto game = load_test_game();
  EXPECT_THROW(game.update_chests({ChestRef{TestRom::BOMBS_10, 4, 2, 2}}), incoherent_chest);
  EXPECT_THROW(game.update_chests({ChestRef{TestRom::BOMBS_10, 3, 1, 0}}), incoherent_chest);
  EXPECT_THROW(game.update_chests({ChestRef{TestRom::BOMBS_10, 5, 0, 0}}), incoherent_chest);
  EXPECT_THROW(game.update_chests({ChestRef{TestRom::BOMBS_10, 9, 0, 0}}), incoherent_chest);
  EXPECT_THROW(game.update_chests({ChestRef{TestRom::BOMBS_10, 0, 9, 0}}), incoherent_chest);
}

TEST(NeutopiaTests, UnmodifiedWritePreservesRoomData) {
  std::string original = TestRom::test_rom();
  auto map = TestRom::test_rom_map();
  auto game = load_test_game();
  std::string written = game.write();

  ASSERT_EQ(written.size(), original.size());
  EXPECT_EQ(written.substr(TestRom::ROOM_DATA_OFFSET, map.chest_free_space_offset - TestRom::ROOM_DATA_OFFSET),
      original.substr(TestRom::ROOM_DATA_OFFSET, map.chest_free_space_offset - TestRom::ROOM_DATA_OFFSET));
  EXPECT_EQ(written.substr(map.area_table_offset, map.area_count * POINTER_SIZE),
      original.substr(map.area_table_offset, map.area_count * POINTER_SIZE));

  // Chest tables move to the free space
  auto rom = parse_output(written);
  auto original_rom = parse_output(original);
  for (size_t z = 0; z < map.chest_table_count; z++) {
    EXPECT_EQ(rom.chest_table_pointers[z], map.chest_free_space_offset + z * map.chest_free_space_stride);
    EXPECT_EQ(rom.areas[z].chest_table, original_rom.areas[z].chest_table);
  }
}

TEST(NeutopiaTests, ConditionalsFollowTheirChest) {
  auto game = load_test_game();
  game.update_chests({
      ChestRef{TestRom::WINGS_CHEST, 4, 0, 0},
      ChestRef{TestRom::BOMBS_5, 4, 2, 0},
  });
  auto rom = parse_output(game.write());

  const auto& old_room = rom.areas[4].rooms[0].object_table;
  ASSERT_EQ(old_room.size(), 2u);
  EXPECT_EQ(old_room[0], TestRom::chest_object(2, 3, 1));
  EXPECT_EQ(old_room[1], TableEntry::make(Type::BOSS_DOOR, 2));

  const auto& new_room = rom.areas[4].rooms[2].object_table;
  ASSERT_EQ(new_room.size(), 4u);
  EXPECT_EQ(new_room[0], TestRom::chest_object(1, 6, 2));
  EXPECT_EQ(new_room[1], TableEntry::make(Type::UNKNOWN_0B, std::string("\x01\x02\x03", 3)));
  // The conditional object is moved to the chest's position
  EXPECT_EQ(new_room[2], TableEntry::make(Type::OBJECT, ObjectInfo{1, 6, 0x60}));
  EXPECT_EQ(new_room[3], TestRom::chest_object(6, 1, 3));

  EXPECT_EQ(rom.areas[4].chest_table[1], TestRom::WINGS_CHEST);
  EXPECT_EQ(rom.areas[4].chest_table[2], TestRom::BOMBS_5);
}

TEST(NeutopiaTests, WritesOnlyOnce) {
  auto game = load_test_game();
  game.write();
  EXPECT_THROW(game.write(), std::logic_error);
}

TEST(NeutopiaTests, AppliesMirroredAreas) {
  auto relocation = TestRom::test_relocation();
  relocation.mirrored_areas.emplace_back(5, 4);
  auto game = load_test_game(relocation);
  auto rom = parse_output(game.write());
  EXPECT_EQ(rom.area_pointers[5], rom.area_pointers[4]);
  EXPECT_EQ(rom.areas[5].rooms[2].object_table, rom.areas[4].rooms[2].object_table);
}

TEST(NeutopiaTests, RejectsInvalidRelocationOptions) {
  RelocationOptions relocation = TestRom::test_relocation();
  relocation.last_area = 6;
  EXPECT_THROW(load_test_game(relocation), std::invalid_argument);

  relocation = TestRom::test_relocation();
  relocation.mirrored_areas.emplace_back(7, 0);
  EXPECT_THROW(load_test_game(relocation), std::invalid_argument);
}

TEST(NeutopiaTests, RejectsRoomDataOverlappingChestSpace) {
  auto map = TestRom::test_rom_map();
  map.chest_free_space_offset = 0x1100;
  Neutopia game(TestRom::test_rom(), map, TestRom::test_relocation());
  EXPECT_THROW(game.write(), format_error);
}

TEST(NeutopiaTests, ReinsertsEveryConditionalInARoom) {
  // A second conditional follows the medallion chest in area 4 room 1
  auto areas = TestRom::test_areas();
  std::vector<TableEntry> medallion_conditional = {
      TableEntry::make(Type::UNKNOWN_0B, std::string("\x04\x05\x06", 3)),
      TableEntry::make(Type::OBJECT, ObjectInfo{5, 5, 0x61}),
  };
  auto& medallion_room = areas[4].rooms[1].object_table;
  medallion_room.insert(medallion_room.end(), medallion_conditional.begin(), medallion_conditional.end());

  Neutopia game(TestRom::build_test_rom(areas), TestRom::test_rom_map(), TestRom::test_relocation());
  ASSERT_EQ(game.get_conditionals().size(), 2u);
  game.update_chests({
      ChestRef{TestRom::WINGS_CHEST, 4, 0, 0},
      ChestRef{TestRom::MAGIC_RING_CHEST, 4, 1, 0},
      ChestRef{TestRom::BOMBS_5, 4, 2, 0},
      ChestRef{TestRom::MEDALLION_1, 4, 2, 1},
  });
  auto rom = parse_output(game.write());

  EXPECT_EQ(rom.areas[4].rooms[0].object_table.size(), 2u);
  EXPECT_EQ(rom.areas[4].rooms[1].object_table.size(), 1u);

  const auto& room = rom.areas[4].rooms[2].object_table;
  ASSERT_EQ(room.size(), 6u);
  EXPECT_EQ(room[0], TestRom::chest_object(1, 6, 2));
  EXPECT_EQ(room[1], TableEntry::make(Type::UNKNOWN_0B, std::string("\x01\x02\x03", 3)));
  EXPECT_EQ(room[2], TableEntry::make(Type::OBJECT, ObjectInfo{1, 6, 0x60}));
  EXPECT_EQ(room[3], TestRom::chest_object(6, 1, 3));
  EXPECT_EQ(room[4], TableEntry::make(Type::UNKNOWN_0B, std::string("\x04\x05\x06", 3)));
  EXPECT_EQ(room[5], TableEntry::make(Type::OBJECT, ObjectInfo{6, 1, 0x61}));

  // The rewritten areas are the same size as before, so area 5 is intact
  EXPECT_EQ(rom.areas[5].rooms[0].object_table, std::vector<TableEntry>{TestRom::chest_object(4, 4, 0)});
}

TEST(NeutopiaTests, MirrorsUnrelocatedAreasThatShareData) {
  // Area 5's area table entry points at area 4's rooms
  auto map = TestRom::test_rom_map();
  std::string data = TestRom::test_rom();
  uint32_t area4_pointer = decode_pointer(data, map.area_table_offset + 4 * POINTER_SIZE);
  TestRom::put_bytes(data, map.area_table_offset + 5 * POINTER_SIZE, encode_pointer(area4_pointer));

  Neutopia game(data, map, TestRom::test_relocation());
  // Moving the conditional into area 0 pushes area 4's data later
  game.update_chests({
      ChestRef{TestRom::BOMBS_5, 0, 0, 0},
      ChestRef{TestRom::BOMBS_10, 4, 0, 0},
  });
  auto rom = parse_output(game.write());

  EXPECT_NE(rom.area_pointers[4], area4_pointer);
  EXPECT_EQ(rom.area_pointers[5], rom.area_pointers[4]);
  EXPECT_EQ(rom.areas[5].rooms[0].object_table, rom.areas[4].rooms[0].object_table);
  EXPECT_EQ(rom.areas[0].rooms[0].object_table.size(), 4u);
}

TEST(NeutopiaTests, RejectsRoomDataOverwritingUnrelocatedAreas) {
  // A conditional after the bombs chest in area 0 room 0
  auto areas = TestRom::test_areas();
  auto& bombs_room = areas[0].rooms[0].object_table;
  auto entries = TestRom::test_conditional_entries();
  bombs_room.insert(bombs_room.begin() + 1, entries.begin(), entries.end());

  // Area 4 follows area 3 directly, so growing area 3 runs into it
  RelocationOptions relocation;
  relocation.first_area = 0;
  relocation.last_area = 3;
  Neutopia game(TestRom::build_test_rom(areas), TestRom::test_rom_map(), relocation);
  game.update_chests({ChestRef{TestRom::BOMBS_10, 3, 0, 0}});
  EXPECT_THROW(game.write(), format_error);
}
